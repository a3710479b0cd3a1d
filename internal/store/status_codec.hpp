#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "internal/model/status_record.hpp"
#include "stagesync/v1/status.pb.h"

namespace stagesync::store {

/*
  Conversions between the in-memory model and the protobuf documents, plus the
  JSON mapping used for everything written to a DocumentStore or published on
  the change channel.

  Decoding validates: unknown status values, missing ids and malformed JSON
  raise util::InvalidArgument.
*/

stagesync::v1::StatusDocument ToDocument(const model::StatusRecord& record);
model::StatusRecord           FromDocument(const stagesync::v1::StatusDocument& doc);

stagesync::v1::StatusPatchDocument ToDocument(const model::StatusPatch& patch);
model::StatusPatch                 FromDocument(const stagesync::v1::StatusPatchDocument& doc);

std::string ToJson(const google::protobuf::Message& message);
void        FromJson(const std::string& json, google::protobuf::Message* message);

std::string         EncodeStatus(const model::StatusRecord& record);
model::StatusRecord DecodeStatus(const std::string& json);

} // namespace stagesync::store
