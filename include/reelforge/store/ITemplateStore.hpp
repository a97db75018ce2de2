// Repository: ReelForge
// Component: Template Store Interface
// Purpose: Persistence of templates keyed by opaque template id
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_STORE_ITEMPLATE_STORE_HPP_
#define REELFORGE_STORE_ITEMPLATE_STORE_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/pipeline/Template.hpp"

namespace reelforge::store {

struct TemplateSummary {
  std::string id;
  int64_t updated_at_ms = 0;
  std::string title;
};

// Implementations must be safe to call from concurrent RPC handlers.
class ITemplateStore {
 public:
  virtual ~ITemplateStore() = default;

  // Inserts or replaces the template with tmpl.id. False on I/O failure or an
  // id that is not a valid key.
  virtual bool Save(const pipeline::Template& tmpl) = 0;

  virtual std::optional<pipeline::Template> Get(const std::string& id) const = 0;

  // Most recently updated first; limit 0 = all.
  virtual std::vector<TemplateSummary> List(size_t limit = 0) const = 0;

  // False when no template has this id.
  virtual bool Delete(const std::string& id) = 0;
};

// Ids are used as file names by the file store: [A-Za-z0-9_-]+ only.
bool IsValidTemplateKey(const std::string& id);

}  // namespace reelforge::store

#endif  // REELFORGE_STORE_ITEMPLATE_STORE_HPP_
