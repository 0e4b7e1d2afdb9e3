#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "s3_cpp/http_date.hpp"
#include "s3_cpp/model/enums.hpp"
#include "s3_cpp/model/get_object.hpp"

namespace s3_cpp {

    /**
     * @brief Input of a PutObject call. The body comes from the
     * RequestDataSupplier passed alongside.
     */
    struct PutObjectRequest {
        std::string bucket;
        std::string key;

        std::optional<OpenEnum<ObjectCannedAcl>> acl;
        std::optional<std::string> cache_control;
        std::optional<std::string> content_disposition;
        std::optional<std::string> content_encoding;
        std::optional<std::string> content_language;
        /// Overrides the length the supplier declares.
        std::optional<std::int64_t> content_length;
        std::optional<std::string> content_md5;
        std::optional<std::string> content_type;
        std::optional<Timestamp> expires;

        std::optional<std::string> grant_full_control;
        std::optional<std::string> grant_read;
        std::optional<std::string> grant_read_acp;
        std::optional<std::string> grant_write_acp;

        std::optional<OpenEnum<ServerSideEncryption>> server_side_encryption;
        std::optional<OpenEnum<StorageClass>> storage_class;
        std::optional<std::string> website_redirect_location;
        std::optional<std::string> sse_customer_algorithm;
        std::optional<std::string> sse_customer_key;
        std::optional<std::string> sse_customer_key_md5;
        std::optional<std::string> sse_kms_key_id;
        std::optional<std::string> sse_kms_encryption_context;
        std::optional<bool> bucket_key_enabled;

        std::optional<OpenEnum<RequestPayer>> request_payer;
        /// URL-encoded query form, e.g. "k1=v1&k2=v2".
        std::optional<std::string> tagging;

        std::optional<OpenEnum<ObjectLockMode>> object_lock_mode;
        std::optional<Timestamp> object_lock_retain_until_date;
        std::optional<OpenEnum<ObjectLockLegalHoldStatus>>
            object_lock_legal_hold_status;

        std::optional<std::string> expected_bucket_owner;

        ObjectMetadata metadata;
    };

    /**
     * @brief Result of a PutObject call, built from the response headers.
     */
    struct PutObjectOutput {
        class Builder;

        std::optional<std::string> request_id;
        std::optional<std::string> extended_request_id;
        std::optional<std::string> version_id;
        std::optional<std::string> e_tag;
        std::optional<std::string> expiration;
        std::optional<OpenEnum<ServerSideEncryption>> server_side_encryption;
        std::optional<std::string> sse_kms_key_id;
        std::optional<bool> bucket_key_enabled;
        std::optional<std::string> sse_customer_algorithm;
        std::optional<std::string> sse_customer_key_md5;
        std::optional<std::string> sse_kms_encryption_context;
        std::optional<OpenEnum<RequestCharged>> request_charged;
    };

    class PutObjectOutput::Builder {
       public:
        Builder& request_id(std::string v) {
            m_out.request_id = std::move(v);
            return *this;
        }
        Builder& extended_request_id(std::string v) {
            m_out.extended_request_id = std::move(v);
            return *this;
        }
        Builder& version_id(std::string v) {
            m_out.version_id = std::move(v);
            return *this;
        }
        Builder& e_tag(std::string v) {
            m_out.e_tag = std::move(v);
            return *this;
        }
        Builder& expiration(std::string v) {
            m_out.expiration = std::move(v);
            return *this;
        }
        Builder& server_side_encryption(OpenEnum<ServerSideEncryption> v) {
            m_out.server_side_encryption = std::move(v);
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
        Builder& sse_customer_algorithm(std::string v) {
            m_out.sse_customer_algorithm = std::move(v);
            return *this;
        }
        Builder& sse_customer_key_md5(std::string v) {
            m_out.sse_customer_key_md5 = std::move(v);
            return *this;
        }
        Builder& sse_kms_encryption_context(std::string v) {
            m_out.sse_kms_encryption_context = std::move(v);
            return *this;
        }
        Builder& request_charged(OpenEnum<RequestCharged> v) {
            m_out.request_charged = std::move(v);
            return *this;
        }

        PutObjectOutput build() const { return m_out; }

       private:
        PutObjectOutput m_out;
    };

}  // namespace s3_cpp
