#pragma once

#include "s3_cpp/model/get_object.hpp"
#include "s3_cpp/model/put_object.hpp"
#include "s3_cpp/request.hpp"
#include "s3_cpp/result.hpp"

namespace s3_cpp {

    /// @brief Prefix of user-defined object metadata headers.
    inline constexpr std::string_view kMetadataHeaderPrefix = "x-amz-meta-";

    /// @brief Append one header per set field of `req` to `out`.
    /// @note Bucket, key, part number and version id are not headers; the
    /// engine puts them in the target.
    void populate_get_object_request_headers(const GetObjectRequest& req,
                                             HeaderList& out);

    void populate_put_object_request_headers(const PutObjectRequest& req,
                                             HeaderList& out);

    /// @brief Map one response header into the builder.
    /// @return true when the header was mapped, false when it is not one
    /// this output knows (ignored), HeaderMapping error when the value
    /// could not be interpreted. Names match case-insensitively.
    Result<bool> populate_get_object_output_header(
        GetObjectOutput::Builder& builder, const HttpHeader& header);

    Result<bool> populate_put_object_output_header(
        PutObjectOutput::Builder& builder, const HttpHeader& header);

}  // namespace s3_cpp
