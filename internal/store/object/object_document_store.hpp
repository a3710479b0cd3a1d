#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/store/document_store.hpp"

namespace stagesync::store::object {

/*
  Durable document store on an Arrow filesystem (local path, GCS or S3).

  Key layout:

      <root_path>/<key>

  Writes replace the whole object; there is no partial update.
*/
class ObjectDocumentStore final : public DocumentStore {
 public:
  ObjectDocumentStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::optional<std::string> Get(const std::string& key) override;
  void                       Put(const std::string& key, const std::string& value) override;
  bool                       Delete(const std::string& key) override;
  std::vector<std::string>   List(const std::string& prefix) override;
  bool                       Ping() override;

  std::string Name() const override {
    return "object";
  }

 private:
  std::string ObjectPath(const std::string& key) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace stagesync::store::object
