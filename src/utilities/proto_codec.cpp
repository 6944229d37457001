#include "peerwire/utilities/proto_codec.hpp"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message.h>

namespace peerwire::utilities {
    Result<std::vector<uint8_t>, SessionFailure> ProtoCodec::SerializeDeterministic(
        const google::protobuf::Message& message) {
        std::string output;
        {
            google::protobuf::io::StringOutputStream stream(&output);
            google::protobuf::io::CodedOutputStream coded_out(&stream);
            coded_out.SetSerializationDeterministic(true);
            if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                return Result<std::vector<uint8_t>, SessionFailure>::Err(
                    SessionFailure::Encode(
                        "Failed to serialize " + std::string(message.GetTypeName()) + " deterministically"));
            }
        }
        return Result<std::vector<uint8_t>, SessionFailure>::Ok(
            std::vector<uint8_t>(output.begin(), output.end()));
    }
}
