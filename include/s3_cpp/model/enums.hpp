#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

#include "open_enum.hpp"

namespace s3_cpp {

    enum class StorageClass : std::uint8_t {
        Standard,
        ReducedRedundancy,
        StandardIa,
        OnezoneIa,
        IntelligentTiering,
        Glacier,
        DeepArchive,
        Outposts,
        GlacierIr,
    };

    enum class RequestPayer : std::uint8_t { Requester };

    enum class RequestCharged : std::uint8_t { Requester };

    enum class ServerSideEncryption : std::uint8_t { Aes256, AwsKms };

    enum class ObjectCannedAcl : std::uint8_t {
        Private,
        PublicRead,
        PublicReadWrite,
        AuthenticatedRead,
        AwsExecRead,
        BucketOwnerRead,
        BucketOwnerFullControl,
    };

    enum class ObjectLockMode : std::uint8_t { Governance, Compliance };

    enum class ObjectLockLegalHoldStatus : std::uint8_t { On, Off };

    enum class ReplicationStatus : std::uint8_t {
        Complete,
        Pending,
        Failed,
        Replica,
    };

    template <>
    struct EnumTraits<StorageClass> {
        static constexpr std::array<std::pair<StorageClass, std::string_view>, 9>
            table{{
                {StorageClass::Standard, "STANDARD"},
                {StorageClass::ReducedRedundancy, "REDUCED_REDUNDANCY"},
                {StorageClass::StandardIa, "STANDARD_IA"},
                {StorageClass::OnezoneIa, "ONEZONE_IA"},
                {StorageClass::IntelligentTiering, "INTELLIGENT_TIERING"},
                {StorageClass::Glacier, "GLACIER"},
                {StorageClass::DeepArchive, "DEEP_ARCHIVE"},
                {StorageClass::Outposts, "OUTPOSTS"},
                {StorageClass::GlacierIr, "GLACIER_IR"},
            }};
    };

    template <>
    struct EnumTraits<RequestPayer> {
        static constexpr std::array<std::pair<RequestPayer, std::string_view>, 1>
            table{{{RequestPayer::Requester, "requester"}}};
    };

    template <>
    struct EnumTraits<RequestCharged> {
        static constexpr std::array<std::pair<RequestCharged, std::string_view>, 1>
            table{{{RequestCharged::Requester, "requester"}}};
    };

    template <>
    struct EnumTraits<ServerSideEncryption> {
        static constexpr std::array<
            std::pair<ServerSideEncryption, std::string_view>, 2>
            table{{
                {ServerSideEncryption::Aes256, "AES256"},
                {ServerSideEncryption::AwsKms, "aws:kms"},
            }};
    };

    template <>
    struct EnumTraits<ObjectCannedAcl> {
        static constexpr std::array<std::pair<ObjectCannedAcl, std::string_view>, 7>
            table{{
                {ObjectCannedAcl::Private, "private"},
                {ObjectCannedAcl::PublicRead, "public-read"},
                {ObjectCannedAcl::PublicReadWrite, "public-read-write"},
                {ObjectCannedAcl::AuthenticatedRead, "authenticated-read"},
                {ObjectCannedAcl::AwsExecRead, "aws-exec-read"},
                {ObjectCannedAcl::BucketOwnerRead, "bucket-owner-read"},
                {ObjectCannedAcl::BucketOwnerFullControl,
                 "bucket-owner-full-control"},
            }};
    };

    template <>
    struct EnumTraits<ObjectLockMode> {
        static constexpr std::array<std::pair<ObjectLockMode, std::string_view>, 2>
            table{{
                {ObjectLockMode::Governance, "GOVERNANCE"},
                {ObjectLockMode::Compliance, "COMPLIANCE"},
            }};
    };

    template <>
    struct EnumTraits<ObjectLockLegalHoldStatus> {
        static constexpr std::array<
            std::pair<ObjectLockLegalHoldStatus, std::string_view>, 2>
            table{{
                {ObjectLockLegalHoldStatus::On, "ON"},
                {ObjectLockLegalHoldStatus::Off, "OFF"},
            }};
    };

    template <>
    struct EnumTraits<ReplicationStatus> {
        static constexpr std::array<
            std::pair<ReplicationStatus, std::string_view>, 4>
            table{{
                {ReplicationStatus::Complete, "COMPLETE"},
                {ReplicationStatus::Pending, "PENDING"},
                {ReplicationStatus::Failed, "FAILED"},
                {ReplicationStatus::Replica, "REPLICA"},
            }};
    };

}  // namespace s3_cpp
