// Repository: ReelForge
// Component: Template Proto Conversion Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/store/TemplateProto.hpp"

#include <google/protobuf/util/json_util.h>

#include "reelforge/timeline/TextStyles.hpp"
#include "reelforge/timeline/TimeMath.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::store {

namespace time_math = timeline::time_math;

namespace {

std::string BytesOf(const std::vector<uint8_t>& v) {
  return std::string(v.begin(), v.end());
}

std::vector<uint8_t> VectorOf(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

void SceneInfoToProto(const timeline::SceneInfo& info, v1::SceneInfo* out) {
  out->set_id(info.id);
  out->set_start_ms(info.start_ms);
  out->set_end_ms(info.end_ms);
  out->set_start_time(time_math::MsToSeconds(info.start_ms));
  out->set_end_time(time_math::MsToSeconds(info.end_ms));
  out->set_duration(time_math::MsToSecondsOneDecimal(info.duration_ms()));
  if (info.text_overlay) out->set_text_overlay(*info.text_overlay);
  ToProto(info.text_style, out->mutable_text_style());
  out->set_style_class(timeline::StyleClassName(info.style_class));
  out->set_description(info.description);
  if (!info.thumbnail_jpeg.empty()) out->set_thumbnail(BytesOf(info.thumbnail_jpeg));
  if (info.media_uri) out->set_media_uri(*info.media_uri);
}

timeline::SceneInfo SceneInfoFromProto(const v1::SceneInfo& msg) {
  timeline::SceneInfo info;
  info.id = msg.id();
  info.start_ms = msg.start_ms();
  info.end_ms = msg.end_ms();
  if (msg.has_text_overlay()) info.text_overlay = msg.text_overlay();
  info.text_style = FromProto(msg.text_style());
  if (auto c = timeline::ParseStyleClass(msg.style_class())) {
    info.style_class = *c;
  } else if (!msg.style_class().empty()) {
    util::Logger::Warn("[TemplateProto] unknown style_class \"" + msg.style_class() + "\"");
  }
  info.description = msg.description();
  info.thumbnail_jpeg = VectorOf(msg.thumbnail());
  if (msg.has_media_uri()) info.media_uri = msg.media_uri();
  return info;
}

}  // namespace

void ToProto(const timeline::TextStyle& style, v1::TextStyle* out) {
  out->set_font_family(style.font_family);
  out->set_font_size(style.font_size);
  out->set_font_weight(style.font_weight);
  out->set_color(style.color);
  if (style.text_shadow) out->set_text_shadow(*style.text_shadow);
  if (style.background_color) out->set_background_color(*style.background_color);
  if (style.emoji) out->set_emoji(*style.emoji);
  if (style.emoji_position) {
    out->set_emoji_position(timeline::EmojiPositionName(*style.emoji_position));
  }
  out->set_position(timeline::ScreenPositionName(style.position));
  out->set_alignment(timeline::TextAlignmentName(style.alignment));
  out->set_emoji_enabled(style.has_emoji());
}

timeline::TextStyle FromProto(const v1::TextStyle& msg) {
  timeline::TextStyle style;
  style.font_family = msg.font_family();
  style.font_size = msg.font_size();
  style.font_weight = msg.font_weight();
  style.color = msg.color();
  if (msg.has_text_shadow()) style.text_shadow = msg.text_shadow();
  if (msg.has_background_color()) style.background_color = msg.background_color();
  if (msg.has_emoji()) style.emoji = msg.emoji();
  if (msg.has_emoji_position()) {
    style.emoji_position = timeline::ParseEmojiPosition(msg.emoji_position());
  }
  if (auto p = timeline::ParseScreenPosition(msg.position())) style.position = *p;
  if (auto a = timeline::ParseTextAlignment(msg.alignment())) style.alignment = *a;
  return style;
}

void ToProto(const pipeline::Template& tmpl, v1::Template* out) {
  out->Clear();
  out->set_id(tmpl.id);
  out->set_type(tmpl.type);
  out->set_total_duration_ms(tmpl.total_duration_ms);
  if (tmpl.video_info) {
    v1::VideoInfo* vi = out->mutable_video_info();
    vi->set_title(tmpl.video_info->title);
    vi->set_source_uri(tmpl.video_info->source_uri);
    vi->set_duration_ms(tmpl.video_info->duration_ms);
  }
  for (const auto& group : tmpl.location_groups) {
    v1::LocationGroup* g = out->add_location_groups();
    g->set_location_id(group.location_id);
    g->set_location_name(group.location_name);
    for (const auto& scene : group.scenes) {
      SceneInfoToProto(scene, g->add_scenes());
    }
    g->set_total_duration_ms(group.total_duration_ms());
    g->set_total_duration(time_math::MsToSecondsOneDecimal(group.total_duration_ms()));
  }
  for (const auto& scene : tmpl.detected_scenes) {
    v1::DetectedScene* d = out->add_detected_scenes();
    d->set_id(scene.id);
    d->set_start_ms(scene.start_ms);
    d->set_end_ms(scene.end_ms);
    d->set_start_time(time_math::MsToSeconds(scene.start_ms));
    d->set_end_time(time_math::MsToSeconds(scene.end_ms));
    d->set_duration(time_math::MsToSecondsOneDecimal(scene.duration_ms()));
    if (!scene.thumbnail_jpeg.empty()) d->set_thumbnail(BytesOf(scene.thumbnail_jpeg));
    d->set_description(scene.description);
  }
  out->set_extraction_method(tmpl.extraction_method);
  out->set_created_at_ms(tmpl.created_at_ms);
  out->set_updated_at_ms(tmpl.updated_at_ms);
  out->set_used_fallback(tmpl.used_fallback);
  out->set_detection_error(timeline::ExtractionErrorToString(tmpl.detection_error));
  out->set_drift_ms(tmpl.drift_ms);
}

pipeline::Template FromProto(const v1::Template& msg) {
  pipeline::Template tmpl;
  tmpl.id = msg.id();
  tmpl.type = msg.type();
  tmpl.total_duration_ms = msg.total_duration_ms();
  if (msg.has_video_info()) {
    pipeline::VideoInfo vi;
    vi.title = msg.video_info().title();
    vi.source_uri = msg.video_info().source_uri();
    vi.duration_ms = msg.video_info().duration_ms();
    tmpl.video_info = std::move(vi);
  }
  for (const auto& g : msg.location_groups()) {
    timeline::LocationGroup group;
    group.location_id = g.location_id();
    group.location_name = g.location_name();
    for (const auto& s : g.scenes()) {
      group.scenes.push_back(SceneInfoFromProto(s));
    }
    tmpl.location_groups.push_back(std::move(group));
  }
  for (const auto& d : msg.detected_scenes()) {
    timeline::Scene scene;
    scene.id = d.id();
    scene.start_ms = d.start_ms();
    scene.end_ms = d.end_ms();
    scene.thumbnail_jpeg = VectorOf(d.thumbnail());
    scene.description = d.description();
    tmpl.detected_scenes.push_back(std::move(scene));
  }
  tmpl.extraction_method = msg.extraction_method();
  tmpl.created_at_ms = msg.created_at_ms();
  tmpl.updated_at_ms = msg.updated_at_ms();
  tmpl.used_fallback = msg.used_fallback();
  if (!msg.detection_error().empty() &&
      !timeline::ExtractionErrorFromString(msg.detection_error(), &tmpl.detection_error)) {
    util::Logger::Warn("[TemplateProto] unknown detection_error \"" + msg.detection_error() +
                       "\"");
  }
  tmpl.drift_ms = msg.drift_ms();
  return tmpl;
}

bool ToJson(const pipeline::Template& tmpl, bool pretty, bool include_thumbnails,
            std::string* out) {
  v1::Template msg;
  ToProto(tmpl, &msg);
  if (!include_thumbnails) {
    for (auto& g : *msg.mutable_location_groups()) {
      for (auto& s : *g.mutable_scenes()) s.clear_thumbnail();
    }
    for (auto& d : *msg.mutable_detected_scenes()) d.clear_thumbnail();
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = pretty;
  options.preserve_proto_field_names = false;
  options.always_print_primitive_fields = true;

  out->clear();
  const auto status = google::protobuf::util::MessageToJsonString(msg, out, options);
  if (!status.ok()) {
    util::Logger::Error("[TemplateProto] JSON rendering failed: " + status.ToString());
    return false;
  }
  return true;
}

}  // namespace reelforge::store
