// Repository: ReelForge
// Component: File Template Store
// Purpose: Directory-backed ITemplateStore (one protobuf record per template)
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_STORE_FILE_TEMPLATE_STORE_HPP_
#define REELFORGE_STORE_FILE_TEMPLATE_STORE_HPP_

#include <mutex>
#include <string>
#include <vector>

#include "reelforge/store/ITemplateStore.hpp"
#include "reelforge_template.pb.h"

namespace reelforge::store {

// Layout:
//   <root>/templates/<id>.pb   serialized reelforge.v1.Template
//   <root>/index.pb            serialized reelforge.v1.TemplateIndex
//
// Files are written to "<path>.tmp.<pid>" and renamed into place. A single
// mutex serializes all access from this process; the index is reloaded from
// disk on every call so the directory stays the source of truth.
class FileTemplateStore : public ITemplateStore {
 public:
  // Creates root and root/templates (mkdir -p style).
  // Throws std::runtime_error when a directory cannot be created.
  explicit FileTemplateStore(const std::string& root);

  FileTemplateStore(const FileTemplateStore&) = delete;
  FileTemplateStore& operator=(const FileTemplateStore&) = delete;

  bool Save(const pipeline::Template& tmpl) override;
  std::optional<pipeline::Template> Get(const std::string& id) const override;
  std::vector<TemplateSummary> List(size_t limit = 0) const override;
  bool Delete(const std::string& id) override;

  const std::string& root() const { return root_; }
  std::string RecordPath(const std::string& id) const;
  std::string IndexPath() const;

 private:
  bool LoadIndexLocked(v1::TemplateIndex* index) const;
  bool WriteIndexLocked(const v1::TemplateIndex& index) const;

  std::string root_;
  std::string templates_dir_;
  mutable std::mutex mutex_;
};

}  // namespace reelforge::store

#endif  // REELFORGE_STORE_FILE_TEMPLATE_STORE_HPP_
