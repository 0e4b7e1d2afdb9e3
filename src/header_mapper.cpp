#include "s3_cpp/header_mapper.hpp"

#include <boost/beast/core/string.hpp>
#include <charconv>
#include <string>
#include <string_view>

namespace s3_cpp {

    namespace {
        using boost::beast::iequals;

        Result<bool> mapping_error(const HttpHeader& h, std::string_view what) {
            return Result<bool>::err(
                Error::Code::HeaderMapping,
                "Could not process response header " + h.name + ": " +
                    std::string(what) + " '" + h.value + "'");
        }

        template <typename Int>
        Result<bool> parse_integer(const HttpHeader& h, Int& out) {
            const auto& v = h.value;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
            if (v.empty() || ec != std::errc{} || ptr != v.data() + v.size()) {
                return mapping_error(h, "not an integer");
            }
            return Result<bool>::ok(true);
        }

        Result<bool> parse_bool(const HttpHeader& h, bool& out) {
            if (iequals(h.value, "true")) {
                out = true;
            } else if (iequals(h.value, "false")) {
                out = false;
            } else {
                return mapping_error(h, "not a boolean");
            }
            return Result<bool>::ok(true);
        }

        Result<bool> parse_date(const HttpHeader& h, Timestamp& out) {
            auto t = parse_http_date(h.value);
            if (!t) return mapping_error(h, "not an RFC 1123 date");
            out = *t;
            return Result<bool>::ok(true);
        }

        void emit(HeaderList& out, std::string_view name,
                  const std::optional<std::string>& v) {
            if (v) out.push_back({std::string(name), *v});
        }

        void emit(HeaderList& out, std::string_view name,
                  const std::optional<Timestamp>& v) {
            if (v) out.push_back({std::string(name), format_http_date(*v)});
        }

        void emit(HeaderList& out, std::string_view name,
                  const std::optional<bool>& v) {
            if (v) out.push_back({std::string(name), *v ? "true" : "false"});
        }

        void emit(HeaderList& out, std::string_view name,
                  const std::optional<std::int64_t>& v) {
            if (v) out.push_back({std::string(name), std::to_string(*v)});
        }

        template <typename E>
        void emit(HeaderList& out, std::string_view name,
                  const std::optional<OpenEnum<E>>& v) {
            if (v) out.push_back({std::string(name), v->wire_value()});
        }

        void emit_metadata(HeaderList& out, const ObjectMetadata& metadata) {
            for (const auto& [name, value] : metadata) {
                out.push_back(
                    {std::string(kMetadataHeaderPrefix) + name, value});
            }
        }

        /// @return the metadata name when `h` is an x-amz-meta-* header.
        std::optional<std::string> metadata_name(const HttpHeader& h) {
            const auto n = kMetadataHeaderPrefix.size();
            if (h.name.size() > n &&
                iequals(std::string_view(h.name).substr(0, n),
                        kMetadataHeaderPrefix)) {
                return h.name.substr(n);
            }
            return std::nullopt;
        }
    }  // namespace

    void populate_get_object_request_headers(const GetObjectRequest& req,
                                             HeaderList& out) {
        emit(out, "If-Match", req.if_match);
        emit(out, "If-Modified-Since", req.if_modified_since);
        emit(out, "If-None-Match", req.if_none_match);
        emit(out, "If-Unmodified-Since", req.if_unmodified_since);
        emit(out, "Range", req.range);
        emit(out, "x-amz-server-side-encryption-customer-algorithm",
             req.sse_customer_algorithm);
        emit(out, "x-amz-server-side-encryption-customer-key",
             req.sse_customer_key);
        emit(out, "x-amz-server-side-encryption-customer-key-MD5",
             req.sse_customer_key_md5);
        emit(out, "x-amz-request-payer", req.request_payer);
        emit(out, "x-amz-expected-bucket-owner", req.expected_bucket_owner);
    }

    void populate_put_object_request_headers(const PutObjectRequest& req,
                                             HeaderList& out) {
        emit(out, "x-amz-acl", req.acl);
        emit(out, "Cache-Control", req.cache_control);
        emit(out, "Content-Disposition", req.content_disposition);
        emit(out, "Content-Encoding", req.content_encoding);
        emit(out, "Content-Language", req.content_language);
        emit(out, "Content-Length", req.content_length);
        emit(out, "Content-MD5", req.content_md5);
        emit(out, "Content-Type", req.content_type);
        emit(out, "Expires", req.expires);
        emit(out, "x-amz-grant-full-control", req.grant_full_control);
        emit(out, "x-amz-grant-read", req.grant_read);
        emit(out, "x-amz-grant-read-acp", req.grant_read_acp);
        emit(out, "x-amz-grant-write-acp", req.grant_write_acp);
        emit(out, "x-amz-server-side-encryption", req.server_side_encryption);
        emit(out, "x-amz-storage-class", req.storage_class);
        emit(out, "x-amz-website-redirect-location",
             req.website_redirect_location);
        emit(out, "x-amz-server-side-encryption-customer-algorithm",
             req.sse_customer_algorithm);
        emit(out, "x-amz-server-side-encryption-customer-key",
             req.sse_customer_key);
        emit(out, "x-amz-server-side-encryption-customer-key-MD5",
             req.sse_customer_key_md5);
        emit(out, "x-amz-server-side-encryption-aws-kms-key-id",
             req.sse_kms_key_id);
        emit(out, "x-amz-server-side-encryption-context",
             req.sse_kms_encryption_context);
        emit(out, "x-amz-server-side-encryption-bucket-key-enabled",
             req.bucket_key_enabled);
        emit(out, "x-amz-request-payer", req.request_payer);
        emit(out, "x-amz-tagging", req.tagging);
        emit(out, "x-amz-object-lock-mode", req.object_lock_mode);
        emit(out, "x-amz-object-lock-retain-until-date",
             req.object_lock_retain_until_date);
        emit(out, "x-amz-object-lock-legal-hold",
             req.object_lock_legal_hold_status);
        emit(out, "x-amz-expected-bucket-owner", req.expected_bucket_owner);
        emit_metadata(out, req.metadata);
    }

    Result<bool> populate_get_object_output_header(
        GetObjectOutput::Builder& b, const HttpHeader& h) {
        const std::string_view name = h.name;
        const auto ok = [] { return Result<bool>::ok(true); };

        if (iequals(name, "x-amz-request-id")) {
            b.request_id(h.value);
        } else if (iequals(name, "x-amz-id-2")) {
            b.extended_request_id(h.value);
        } else if (iequals(name, "Last-Modified")) {
            Timestamp t;
            if (auto r = parse_date(h, t); !r) return r;
            b.last_modified(t);
        } else if (iequals(name, "ETag")) {
            b.e_tag(h.value);
        } else if (iequals(name, "x-amz-version-id")) {
            b.version_id(h.value);
        } else if (iequals(name, "Accept-Ranges")) {
            b.accept_ranges(h.value);
        } else if (iequals(name, "Content-Type")) {
            b.content_type(h.value);
        } else if (iequals(name, "Content-Length")) {
            std::int64_t n = 0;
            if (auto r = parse_integer(h, n); !r) return r;
            b.content_length(n);
        } else if (iequals(name, "Cache-Control")) {
            b.cache_control(h.value);
        } else if (iequals(name, "Content-Disposition")) {
            b.content_disposition(h.value);
        } else if (iequals(name, "Content-Encoding")) {
            b.content_encoding(h.value);
        } else if (iequals(name, "Content-Language")) {
            b.content_language(h.value);
        } else if (iequals(name, "Content-Range")) {
            b.content_range(h.value);
        } else if (iequals(name, "Expires")) {
            Timestamp t;
            if (auto r = parse_date(h, t); !r) return r;
            b.expires(t);
        } else if (iequals(name, "x-amz-delete-marker")) {
            bool v = false;
            if (auto r = parse_bool(h, v); !r) return r;
            b.delete_marker(v);
        } else if (iequals(name, "x-amz-expiration")) {
            b.expiration(h.value);
        } else if (iequals(name, "x-amz-restore")) {
            b.restore(h.value);
        } else if (iequals(name, "x-amz-missing-meta")) {
            std::int32_t n = 0;
            if (auto r = parse_integer(h, n); !r) return r;
            b.missing_meta(n);
        } else if (iequals(name, "x-amz-website-redirect-location")) {
            b.website_redirect_location(h.value);
        } else if (iequals(name, "x-amz-server-side-encryption")) {
            b.server_side_encryption(from_wire<ServerSideEncryption>(h.value));
        } else if (iequals(name,
                           "x-amz-server-side-encryption-customer-algorithm")) {
            b.sse_customer_algorithm(h.value);
        } else if (iequals(name,
                           "x-amz-server-side-encryption-customer-key-MD5")) {
            b.sse_customer_key_md5(h.value);
        } else if (iequals(name,
                           "x-amz-server-side-encryption-aws-kms-key-id")) {
            b.sse_kms_key_id(h.value);
        } else if (iequals(name,
                           "x-amz-server-side-encryption-bucket-key-enabled")) {
            bool v = false;
            if (auto r = parse_bool(h, v); !r) return r;
            b.bucket_key_enabled(v);
        } else if (iequals(name, "x-amz-storage-class")) {
            b.storage_class(from_wire<StorageClass>(h.value));
        } else if (iequals(name, "x-amz-request-charged")) {
            b.request_charged(from_wire<RequestCharged>(h.value));
        } else if (iequals(name, "x-amz-replication-status")) {
            b.replication_status(from_wire<ReplicationStatus>(h.value));
        } else if (iequals(name, "x-amz-mp-parts-count")) {
            std::int32_t n = 0;
            if (auto r = parse_integer(h, n); !r) return r;
            b.parts_count(n);
        } else if (iequals(name, "x-amz-tagging-count")) {
            std::int32_t n = 0;
            if (auto r = parse_integer(h, n); !r) return r;
            b.tag_count(n);
        } else if (iequals(name, "x-amz-object-lock-mode")) {
            b.object_lock_mode(from_wire<ObjectLockMode>(h.value));
        } else if (iequals(name, "x-amz-object-lock-retain-until-date")) {
            Timestamp t;
            if (auto r = parse_date(h, t); !r) return r;
            b.object_lock_retain_until_date(t);
        } else if (iequals(name, "x-amz-object-lock-legal-hold")) {
            b.object_lock_legal_hold_status(
                from_wire<ObjectLockLegalHoldStatus>(h.value));
        } else if (auto meta = metadata_name(h)) {
            b.metadata(std::move(*meta), h.value);
        } else {
            return Result<bool>::ok(false);
        }
        return ok();
    }

    Result<bool> populate_put_object_output_header(
        PutObjectOutput::Builder& b, const HttpHeader& h) {
        const std::string_view name = h.name;

        if (iequals(name, "x-amz-request-id")) {
            b.request_id(h.value);
        } else if (iequals(name, "x-amz-id-2")) {
            b.extended_request_id(h.value);
        } else if (iequals(name, "x-amz-version-id")) {
            b.version_id(h.value);
        } else if (iequals(name, "ETag")) {
            b.e_tag(h.value);
        } else if (iequals(name, "x-amz-expiration")) {
            b.expiration(h.value);
        } else if (iequals(name, "x-amz-server-side-encryption")) {
            b.server_side_encryption(from_wire<ServerSideEncryption>(h.value));
        } else if (iequals(name,
                           "x-amz-server-side-encryption-aws-kms-key-id")) {
            b.sse_kms_key_id(h.value);
        } else if (iequals(name,
                           "x-amz-server-side-encryption-bucket-key-enabled")) {
            bool v = false;
            if (auto r = parse_bool(h, v); !r) return r;
            b.bucket_key_enabled(v);
        } else if (iequals(name,
                           "x-amz-server-side-encryption-customer-algorithm")) {
            b.sse_customer_algorithm(h.value);
        } else if (iequals(name,
                           "x-amz-server-side-encryption-customer-key-MD5")) {
            b.sse_customer_key_md5(h.value);
        } else if (iequals(name, "x-amz-server-side-encryption-context")) {
            b.sse_kms_encryption_context(h.value);
        } else if (iequals(name, "x-amz-request-charged")) {
            b.request_charged(from_wire<RequestCharged>(h.value));
        } else {
            return Result<bool>::ok(false);
        }
        return Result<bool>::ok(true);
    }

}  // namespace s3_cpp
