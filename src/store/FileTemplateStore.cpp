// Repository: ReelForge
// Component: File Template Store Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/store/FileTemplateStore.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

#include "reelforge/store/TemplateProto.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::store {

namespace {

bool ReadFile(const std::string& path, std::string* contents) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) return false;
  contents->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

// Writes to a pid-suffixed temp file and renames it over `path`.
bool WriteFileAtomic(const std::string& path, const std::string& contents) {
  const std::string tmp_path =
      path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!of) return false;
    of.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    of.flush();
    if (!of) {
      (void)unlink(tmp_path.c_str());
      return false;
    }
  }
  if (rename(tmp_path.c_str(), path.c_str()) != 0) {
    (void)unlink(tmp_path.c_str());
    return false;
  }
  return true;
}

bool FileExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

}  // namespace

bool IsValidTemplateKey(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  return std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
  });
}

FileTemplateStore::FileTemplateStore(const std::string& root)
    : root_(root), templates_dir_(root + "/templates") {
  // Create root then templates dir (mkdir -p style)
  if (mkdir(root_.c_str(), 0755) != 0 && errno != EEXIST) {
    throw std::runtime_error("FileTemplateStore: cannot create directory " + root_);
  }
  if (mkdir(templates_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
    throw std::runtime_error("FileTemplateStore: cannot create directory " + templates_dir_);
  }
}

std::string FileTemplateStore::RecordPath(const std::string& id) const {
  return templates_dir_ + "/" + id + ".pb";
}

std::string FileTemplateStore::IndexPath() const {
  return root_ + "/index.pb";
}

bool FileTemplateStore::LoadIndexLocked(v1::TemplateIndex* index) const {
  index->Clear();
  if (!FileExists(IndexPath())) return true;

  std::string bytes;
  if (!ReadFile(IndexPath(), &bytes) || !index->ParseFromString(bytes)) {
    util::Logger::Error("[FileTemplateStore] index unreadable: " + IndexPath());
    return false;
  }
  return true;
}

bool FileTemplateStore::WriteIndexLocked(const v1::TemplateIndex& index) const {
  std::string bytes;
  if (!index.SerializeToString(&bytes) || !WriteFileAtomic(IndexPath(), bytes)) {
    util::Logger::Error("[FileTemplateStore] index write failed: " + IndexPath());
    return false;
  }
  return true;
}

bool FileTemplateStore::Save(const pipeline::Template& tmpl) {
  if (!IsValidTemplateKey(tmpl.id)) {
    util::Logger::Error("[FileTemplateStore] refusing invalid template id \"" + tmpl.id + "\"");
    return false;
  }

  v1::Template msg;
  ToProto(tmpl, &msg);
  std::string bytes;
  if (!msg.SerializeToString(&bytes)) {
    util::Logger::Error("[FileTemplateStore] serialize failed id=" + tmpl.id);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!WriteFileAtomic(RecordPath(tmpl.id), bytes)) {
    util::Logger::Error("[FileTemplateStore] record write failed: " + RecordPath(tmpl.id));
    return false;
  }

  v1::TemplateIndex index;
  if (!LoadIndexLocked(&index)) return false;

  v1::TemplateIndexEntry* entry = nullptr;
  for (auto& e : *index.mutable_entries()) {
    if (e.id() == tmpl.id) {
      entry = &e;
      break;
    }
  }
  if (!entry) entry = index.add_entries();
  entry->set_id(tmpl.id);
  entry->set_updated_at_ms(tmpl.updated_at_ms);
  entry->set_title(tmpl.video_info ? tmpl.video_info->title : std::string());

  if (!WriteIndexLocked(index)) return false;

  util::Logger::Info("[FileTemplateStore] saved id=" + tmpl.id);
  return true;
}

std::optional<pipeline::Template> FileTemplateStore::Get(const std::string& id) const {
  if (!IsValidTemplateKey(id)) return std::nullopt;

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string path = RecordPath(id);
  if (!FileExists(path)) return std::nullopt;

  std::string bytes;
  v1::Template msg;
  if (!ReadFile(path, &bytes) || !msg.ParseFromString(bytes)) {
    util::Logger::Error("[FileTemplateStore] record unreadable: " + path);
    return std::nullopt;
  }
  return FromProto(msg);
}

std::vector<TemplateSummary> FileTemplateStore::List(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  v1::TemplateIndex index;
  if (!LoadIndexLocked(&index)) return {};

  std::vector<TemplateSummary> out;
  out.reserve(static_cast<size_t>(index.entries_size()));
  for (const auto& e : index.entries()) {
    out.push_back(TemplateSummary{e.id(), e.updated_at_ms(), e.title()});
  }
  // Ties keep insertion order, newest insert first.
  std::reverse(out.begin(), out.end());
  std::stable_sort(out.begin(), out.end(),
                   [](const TemplateSummary& a, const TemplateSummary& b) {
                     return a.updated_at_ms > b.updated_at_ms;
                   });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

bool FileTemplateStore::Delete(const std::string& id) {
  if (!IsValidTemplateKey(id)) return false;

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string path = RecordPath(id);
  const bool existed = FileExists(path);
  if (existed && unlink(path.c_str()) != 0) {
    util::Logger::Error("[FileTemplateStore] unlink failed: " + path);
    return false;
  }

  v1::TemplateIndex index;
  if (!LoadIndexLocked(&index)) return existed;

  auto* entries = index.mutable_entries();
  const int before = entries->size();
  for (int i = entries->size() - 1; i >= 0; --i) {
    if (entries->Get(i).id() == id) entries->DeleteSubrange(i, 1);
  }
  if (entries->size() != before && !WriteIndexLocked(index)) return false;

  if (existed) util::Logger::Info("[FileTemplateStore] deleted id=" + id);
  return existed;
}

}  // namespace reelforge::store
