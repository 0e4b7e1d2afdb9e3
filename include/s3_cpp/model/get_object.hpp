#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "s3_cpp/http_date.hpp"
#include "s3_cpp/model/enums.hpp"

namespace s3_cpp {

    /// @brief User metadata, keyed by the part after `x-amz-meta-`.
    using ObjectMetadata = std::map<std::string, std::string>;

    /**
     * @brief Input of a GetObject call.
     *
     * Every optional field that is set becomes one request header (or query
     * parameter for part_number and version_id).
     */
    struct GetObjectRequest {
        std::string bucket;
        std::string key;

        std::optional<std::string> if_match;
        std::optional<Timestamp> if_modified_since;
        std::optional<std::string> if_none_match;
        std::optional<Timestamp> if_unmodified_since;
        /// Sent verbatim, e.g. "bytes=0-99".
        std::optional<std::string> range;
        std::optional<std::int32_t> part_number;
        std::optional<std::string> version_id;

        std::optional<std::string> sse_customer_algorithm;
        std::optional<std::string> sse_customer_key;
        std::optional<std::string> sse_customer_key_md5;

        std::optional<OpenEnum<RequestPayer>> request_payer;
        std::optional<std::string> expected_bucket_owner;
    };

    /**
     * @brief Result of a GetObject call, built from the response headers.
     */
    struct GetObjectOutput {
        class Builder;

        std::optional<std::string> request_id;
        std::optional<std::string> extended_request_id;

        std::optional<Timestamp> last_modified;
        std::optional<std::string> e_tag;
        std::optional<std::string> version_id;
        std::optional<std::string> accept_ranges;

        std::optional<std::string> content_type;
        std::optional<std::int64_t> content_length;
        std::optional<std::string> cache_control;
        std::optional<std::string> content_disposition;
        std::optional<std::string> content_encoding;
        std::optional<std::string> content_language;
        std::optional<std::string> content_range;
        std::optional<Timestamp> expires;

        std::optional<bool> delete_marker;
        std::optional<std::string> expiration;
        std::optional<std::string> restore;
        std::optional<std::int32_t> missing_meta;
        std::optional<std::string> website_redirect_location;

        std::optional<OpenEnum<ServerSideEncryption>> server_side_encryption;
        std::optional<std::string> sse_customer_algorithm;
        std::optional<std::string> sse_customer_key_md5;
        std::optional<std::string> sse_kms_key_id;
        std::optional<bool> bucket_key_enabled;

        std::optional<OpenEnum<StorageClass>> storage_class;
        std::optional<OpenEnum<RequestCharged>> request_charged;
        std::optional<OpenEnum<ReplicationStatus>> replication_status;
        std::optional<std::int32_t> parts_count;
        std::optional<std::int32_t> tag_count;

        std::optional<OpenEnum<ObjectLockMode>> object_lock_mode;
        std::optional<Timestamp> object_lock_retain_until_date;
        std::optional<OpenEnum<ObjectLockLegalHoldStatus>>
            object_lock_legal_hold_status;

        ObjectMetadata metadata;
    };

    /// @brief Incremental construction of GetObjectOutput, one header at a time.
    class GetObjectOutput::Builder {
       public:
        Builder& request_id(std::string v) {
            m_out.request_id = std::move(v);
            return *this;
        }
        Builder& extended_request_id(std::string v) {
            m_out.extended_request_id = std::move(v);
            return *this;
        }
        Builder& last_modified(Timestamp v) {
            m_out.last_modified = v;
            return *this;
        }
        Builder& e_tag(std::string v) {
            m_out.e_tag = std::move(v);
            return *this;
        }
        Builder& version_id(std::string v) {
            m_out.version_id = std::move(v);
            return *this;
        }
        Builder& accept_ranges(std::string v) {
            m_out.accept_ranges = std::move(v);
            return *this;
        }
        Builder& content_type(std::string v) {
            m_out.content_type = std::move(v);
            return *this;
        }
        Builder& content_length(std::int64_t v) {
            m_out.content_length = v;
            return *this;
        }
        Builder& cache_control(std::string v) {
            m_out.cache_control = std::move(v);
            return *this;
        }
        Builder& content_disposition(std::string v) {
            m_out.content_disposition = std::move(v);
            return *this;
        }
        Builder& content_encoding(std::string v) {
            m_out.content_encoding = std::move(v);
            return *this;
        }
        Builder& content_language(std::string v) {
            m_out.content_language = std::move(v);
            return *this;
        }
        Builder& content_range(std::string v) {
            m_out.content_range = std::move(v);
            return *this;
        }
        Builder& expires(Timestamp v) {
            m_out.expires = v;
            return *this;
        }
        Builder& delete_marker(bool v) {
            m_out.delete_marker = v;
            return *this;
        }
        Builder& expiration(std::string v) {
            m_out.expiration = std::move(v);
            return *this;
        }
        Builder& restore(std::string v) {
            m_out.restore = std::move(v);
            return *this;
        }
        Builder& missing_meta(std::int32_t v) {
            m_out.missing_meta = v;
            return *this;
        }
        Builder& website_redirect_location(std::string v) {
            m_out.website_redirect_location = std::move(v);
            return *this;
        }
        Builder& server_side_encryption(OpenEnum<ServerSideEncryption> v) {
            m_out.server_side_encryption = std::move(v);
            return *this;
        }
        Builder& sse_customer_algorithm(std::string v) {
            m_out.sse_customer_algorithm = std::move(v);
            return *this;
        }
        Builder& sse_customer_key_md5(std::string v) {
            m_out.sse_customer_key_md5 = std::move(v);
            return *this;
        }
        Builder& sse_kms_key_id(std::string v) {
            m_out.sse_kms_key_id = std::move(v);
            return *this;
        }
        Builder& bucket_key_enabled(bool v) {
            m_out.bucket_key_enabled = v;
            return *this;
        }
        Builder& storage_class(OpenEnum<StorageClass> v) {
            m_out.storage_class = std::move(v);
            return *this;
        }
        Builder& request_charged(OpenEnum<RequestCharged> v) {
            m_out.request_charged = std::move(v);
            return *this;
        }
        Builder& replication_status(OpenEnum<ReplicationStatus> v) {
            m_out.replication_status = std::move(v);
            return *this;
        }
        Builder& parts_count(std::int32_t v) {
            m_out.parts_count = v;
            return *this;
        }
        Builder& tag_count(std::int32_t v) {
            m_out.tag_count = v;
            return *this;
        }
        Builder& object_lock_mode(OpenEnum<ObjectLockMode> v) {
            m_out.object_lock_mode = std::move(v);
            return *this;
        }
        Builder& object_lock_retain_until_date(Timestamp v) {
            m_out.object_lock_retain_until_date = v;
            return *this;
        }
        Builder& object_lock_legal_hold_status(
            OpenEnum<ObjectLockLegalHoldStatus> v) {
            m_out.object_lock_legal_hold_status = std::move(v);
            return *this;
        }
        Builder& metadata(std::string name, std::string value) {
            m_out.metadata.insert_or_assign(std::move(name), std::move(value));
            return *this;
        }

        /// @brief Snapshot of everything set so far. The builder stays usable.
        GetObjectOutput build() const { return m_out; }

       private:
        GetObjectOutput m_out;
    };

}  // namespace s3_cpp
