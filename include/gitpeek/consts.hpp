#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitpeek::consts {

// Directory and file names
inline constexpr std::string_view kGitDir     = ".git";
inline constexpr std::string_view kObjectsDir = "objects";
inline constexpr std::string_view kPackDir    = "pack";
inline constexpr std::string_view kConfigFile = "config";
inline constexpr std::string_view kPackExt    = ".pack";
inline constexpr std::string_view kIndexExt   = ".idx";
inline constexpr std::string_view kGitdirLinePrefix = "gitdir: ";

// Git object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";
inline constexpr std::string_view kTypeTag    = "tag";

// ——— Object ID sizes ———
inline constexpr std::size_t kSha1RawLen   = 20;
inline constexpr std::size_t kSha256RawLen = 32;
inline constexpr std::size_t kMaxRawLen    = kSha256RawLen;
inline constexpr std::size_t kMinAbbrevLen = 4; // shortest accepted abbreviated hex id

// ——— Loose object fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// ——— Pack file (*.pack) ———
inline constexpr std::string_view kPackMagic = "PACK";
inline constexpr std::size_t kPackHeaderLen = 12; // magic + version + object count

// ——— Pack index (*.idx) ———
inline constexpr std::string_view kIndexMagic = "\377tOc";
inline constexpr std::uint32_t kIndexVersion2 = 2;
inline constexpr std::size_t kFanoutEntries   = 256;
inline constexpr std::uint32_t kLargeOffsetFlag = 0x80000000U;

// ——— Delta streams ———
inline constexpr std::size_t kDefaultCopyLen = 0x10000; // copy opcode with no size bytes

// Git refuses to build chains deeper than 4095; anything at or past this is corrupt.
inline constexpr std::size_t kDefaultMaxDeltaDepth = 4096;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';

} // namespace gitpeek::consts
