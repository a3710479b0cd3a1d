#include "arrow_utils.hpp"

#include <arrow/filesystem/gcsfs.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace stagesync::store::object {

namespace config = stagesync::runtime::config;

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const config::ObjectStoreConfig& object_config) {
  std::string resolved_path = object_config.root_path();
  if (resolved_path.empty()) {
    return arrow::Status::Invalid("object store root_path is required");
  }

  switch (object_config.filesystem()) {
    case config::FILE_SYSTEM_LOCAL: {
      return std::make_pair(std::make_shared<arrow::fs::LocalFileSystem>(), resolved_path);
    }

    case config::FILE_SYSTEM_S3: {
      const auto& proto_options = object_config.s3();
      ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
      ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(resolved_path, &resolved_path));
      if (!proto_options.region().empty()) {
        options.region = proto_options.region();
      }
      if (!proto_options.endpoint_override().empty()) {
        options.endpoint_override = proto_options.endpoint_override();
      }
      if (!proto_options.scheme().empty()) {
        options.scheme = proto_options.scheme();
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
      return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }

    case config::FILE_SYSTEM_GCS: {
      const auto& proto_options = object_config.gcs();
      ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::GcsOptions::FromUri(resolved_path, &resolved_path));
      if (proto_options.anonymous()) {
        options = arrow::fs::GcsOptions::Anonymous();
      } else if (!proto_options.json_credentials().empty()) {
        options = arrow::fs::GcsOptions::FromServiceAccountCredentials(proto_options.json_credentials());
      }
      if (!proto_options.endpoint_override().empty()) {
        options.endpoint_override = proto_options.endpoint_override();
      }
      if (!proto_options.scheme().empty()) {
        options.scheme = proto_options.scheme();
      }
      if (!proto_options.project_id().empty()) {
        options.project_id = proto_options.project_id();
      }
      auto fs = arrow::fs::GcsFileSystem::Make(options);
      return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }

    case config::FILE_SYSTEM_AUTO:
    default: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

} // namespace stagesync::store::object
