#include "object_document_store.hpp"

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <algorithm>

#include "internal/store/object/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace stagesync::store::object {

namespace {

void ValidateKey(const std::string& key) {
  if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
    throw util::InvalidArgument("invalid document key: " + key);
  }
}

} // namespace

ObjectDocumentStore::ObjectDocumentStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
  while (root_path_.size() > 1 && root_path_.back() == '/') {
    root_path_.pop_back();
  }
  Unwrap(fs_->CreateDir(root_path_, /*recursive=*/true));
}

std::string ObjectDocumentStore::ObjectPath(const std::string& key) const {
  ValidateKey(key);
  return root_path_ + "/" + key;
}

/*
  Download full object
*/
std::optional<std::string> ObjectDocumentStore::Get(const std::string& key) {
  const auto path = ObjectPath(key);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) return std::nullopt;

  auto input  = Unwrap(fs_->OpenInputFile(path));
  auto size   = Unwrap(input->GetSize());
  auto buffer = Unwrap(input->Read(size));
  return buffer->ToString();
}

void ObjectDocumentStore::Put(const std::string& key, const std::string& value) {
  const auto path  = ObjectPath(key);
  const auto slash = path.rfind('/');
  if (slash != std::string::npos && slash > 0) {
    Unwrap(fs_->CreateDir(path.substr(0, slash), /*recursive=*/true));
  }

  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(value.data(), static_cast<int64_t>(value.size())));
  Unwrap(out->Close());
}

bool ObjectDocumentStore::Delete(const std::string& key) {
  const auto path = ObjectPath(key);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) return false;

  Unwrap(fs_->DeleteFile(path));
  return true;
}

std::vector<std::string> ObjectDocumentStore::List(const std::string& prefix) {
  // Walk from the deepest directory the prefix names, then filter by prefix.
  std::string dir   = root_path_;
  const auto  slash = prefix.rfind('/');
  if (slash != std::string::npos) {
    dir += "/" + prefix.substr(0, slash);
  }

  arrow::fs::FileSelector selector;
  selector.base_dir       = dir;
  selector.recursive      = true;
  selector.allow_not_found = true;

  auto infos = Unwrap(fs_->GetFileInfo(selector));

  std::vector<std::string> keys;
  const auto               root_len = root_path_.size() + 1;
  for (const auto& info : infos) {
    if (info.type() != arrow::fs::FileType::File || info.path().size() <= root_len) continue;
    auto key = info.path().substr(root_len);
    if (key.compare(0, prefix.size(), prefix) == 0) keys.push_back(std::move(key));
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

bool ObjectDocumentStore::Ping() {
  auto info = fs_->GetFileInfo(root_path_);
  return info.ok() && info->type() == arrow::fs::FileType::Directory;
}

} // namespace stagesync::store::object
