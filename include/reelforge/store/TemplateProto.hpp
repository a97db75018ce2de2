// Repository: ReelForge
// Component: Template Proto Conversion
// Purpose: Template <-> reelforge.v1.Template, and JSON rendering
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_STORE_TEMPLATE_PROTO_HPP_
#define REELFORGE_STORE_TEMPLATE_PROTO_HPP_

#include <string>

#include "reelforge/pipeline/Template.hpp"
#include "reelforge_template.pb.h"

namespace reelforge::store {

void ToProto(const pipeline::Template& tmpl, v1::Template* out);

// Unknown enum strings fall back to defaults (and are logged).
pipeline::Template FromProto(const v1::Template& msg);

void ToProto(const timeline::TextStyle& style, v1::TextStyle* out);
timeline::TextStyle FromProto(const v1::TextStyle& msg);

// protobuf JSON printer output with lowerCamelCase keys (locationId,
// startTime, textOverlay, totalDuration). Thumbnails are dropped unless
// include_thumbnails is set; they are base64 in JSON.
bool ToJson(const pipeline::Template& tmpl, bool pretty, bool include_thumbnails,
            std::string* out);

}  // namespace reelforge::store

#endif  // REELFORGE_STORE_TEMPLATE_PROTO_HPP_
