#pragma once

#include <string_view>

namespace pw::errors::msg {
// TSK002_Message_Catalog centralized message catalog
inline constexpr std::string_view kManifestMissing{"Plugin manifest not found"};
inline constexpr std::string_view kManifestMalformed{"Plugin manifest is not valid JSON"};
inline constexpr std::string_view kSignatureBlockMissing{"Manifest does not contain a signature block"};
inline constexpr std::string_view kSignatureBlockMalformed{"Manifest signature block is malformed"};
inline constexpr std::string_view kSignatureMismatch{"Signature does not match signer certificate"};
inline constexpr std::string_view kContentHashMismatch{"Plugin content hash does not match signed hash"};
inline constexpr std::string_view kCertificateUnparseable{"Unable to parse signer certificate"};
inline constexpr std::string_view kChainIncomplete{"Certificate chain does not terminate at a trust anchor"};
inline constexpr std::string_view kTrustAnchorMissing{"No registered trust anchor matches the certificate chain"};
inline constexpr std::string_view kCertificateNotYetValid{"Certificate is not yet valid"};
inline constexpr std::string_view kCertificateExpired{"Certificate has expired"};
inline constexpr std::string_view kCertificateRevoked{"Certificate has been revoked"};
inline constexpr std::string_view kPermissionsExceedGrant{"Manifest permissions exceed certificate grant"};
inline constexpr std::string_view kAnchorNotSelfSigned{"Trust anchor must be a self-signed certificate"};
inline constexpr std::string_view kUnsupportedHashAlgorithm{"Unsupported hash algorithm"};
inline constexpr std::string_view kUnsupportedSignatureAlgorithm{"Unsupported signature algorithm"};
inline constexpr std::string_view kPrivateKeyUnreadable{"Unable to load private key"};
inline constexpr std::string_view kCodeTooLarge{"Code exceeds maximum size"};
inline constexpr std::string_view kContextTooLarge{"Execution context exceeds maximum size"};
inline constexpr std::string_view kDangerousCode{"Code contains potentially dangerous patterns"};
inline constexpr std::string_view kSandboxNotActive{"Sandbox is not active"};
inline constexpr std::string_view kSandboxStopped{"Sandbox stopped before execution completed"};
inline constexpr std::string_view kExecutionTimedOut{"Execution timed out"};
inline constexpr std::string_view kUnitChannelClosed{"Execution unit channel closed"};
inline constexpr std::string_view kSandboxNotFound{"Sandbox not found"};
inline constexpr std::string_view kIncidentNotFound{"Incident not found"};
inline constexpr std::string_view kInvalidIncidentTransition{"Invalid incident status transition"};
inline constexpr std::string_view kResolutionRequired{"Incident cannot be closed without a recorded resolution"};
inline constexpr std::string_view kPolicyNotFound{"Security policy not found"};
inline constexpr std::string_view kTrustAnchorUnknown{"Trust anchor is not registered"};
inline constexpr std::string_view kNoRunningSandbox{"Plugin has no running sandbox"};
inline constexpr std::string_view kProfileVersionConflict{"Security profile changed concurrently"};
inline constexpr std::string_view kAnalysisTimedOut{"Analysis exceeded time budget"};
inline constexpr std::string_view kAnalysisRootMissing{"Analysis root does not exist"};
}  // namespace pw::errors::msg
