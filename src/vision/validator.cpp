#include <imgpipe/vision/validator.hpp>
#include <imgpipe/core/digest.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

namespace imgpipe::vision {

namespace {

using imgpipe::core::ValidationError;
using imgpipe::core::ValidationFailure;

constexpr std::array<std::string_view, 3> kAllowedExtensions{".jpg", ".jpeg", ".png"};
constexpr std::array<std::string_view, 2> kAllowedMimeTypes{"image/jpeg", "image/png"};

constexpr unsigned char kJpegSignature[] = {0xFF, 0xD8, 0xFF};
constexpr unsigned char kPngSignature[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

template <std::size_t N>
bool starts_with(std::span<const std::byte> data, const unsigned char (&sig)[N]) {
  return data.size() >= N && std::memcmp(data.data(), sig, N) == 0;
}

std::unexpected<ValidationFailure> reject(ValidationError code, std::string message) {
  return std::unexpected(ValidationFailure{code, std::move(message)});
}

}  // namespace

std::string lowercase_extension(std::string_view filename) {
  const auto slash = filename.find_last_of("/\\");
  const std::string_view base =
      slash == std::string_view::npos ? filename : filename.substr(slash + 1);
  const auto dot = base.rfind('.');
  // ".bashrc" has no extension; "photo." neither
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == base.size()) return "";
  return to_lower(base.substr(dot));
}

std::string normalize_mime_type(std::string_view content_type) {
  std::string_view v = content_type.substr(0, content_type.find(';'));
  const auto start = v.find_first_not_of(" \t");
  if (start == std::string_view::npos) return "";
  const auto end = v.find_last_not_of(" \t");
  return to_lower(v.substr(start, end - start + 1));
}

bool matches_signature(std::string_view mime_type, std::span<const std::byte> data) {
  if (mime_type == "image/jpeg") return starts_with(data, kJpegSignature);
  if (mime_type == "image/png") return starts_with(data, kPngSignature);
  return false;
}

std::expected<core::ValidatedUpload, core::ValidationFailure>
validate_upload(std::string_view filename,
                std::string_view content_type,
                std::vector<std::byte> bytes,
                const IImageDecoder& decoder,
                const ValidatorLimits& limits) {
  const std::string extension = lowercase_extension(filename);
  if (std::find(kAllowedExtensions.begin(), kAllowedExtensions.end(), extension) ==
      kAllowedExtensions.end()) {
    return reject(ValidationError::BadExtension,
                  "Bad Extension " + (extension.empty() ? std::string("none") : extension));
  }

  const std::string mime = normalize_mime_type(content_type);
  if (std::find(kAllowedMimeTypes.begin(), kAllowedMimeTypes.end(), mime) ==
      kAllowedMimeTypes.end()) {
    return reject(ValidationError::BadMimeType,
                  "Bad MIME type: " + (mime.empty() ? std::string("(none)") : mime));
  }

  if (bytes.empty()) {
    return reject(ValidationError::EmptyUpload, "Empty upload");
  }
  if (bytes.size() > limits.max_upload_bytes) {
    return reject(ValidationError::OversizedImage, "Upload exceeds maximum size");
  }

  if (!matches_signature(mime, bytes)) {
    return reject(ValidationError::SignatureMismatch, "File bytes do not match image type");
  }

  core::ValidatedUpload out;
  out.extension = extension;
  out.mime_type = mime;

  auto header = decoder.decode_dimensions(bytes);
  if (!header) {
    return reject(ValidationError::CorruptImage, "Invalid or corrupted image");
  }
  const std::uint64_t pixels = static_cast<std::uint64_t>(header->width) * header->height;
  if (pixels <= limits.max_pixels) {
    auto frame = decoder.decode_full(bytes);
    if (!frame) {
      return reject(ValidationError::CorruptImage, "Invalid or corrupted image");
    }
    out.width = header->width;
    out.height = header->height;
    out.format = std::string(format_name(header->format));
  }
  // else: zero-dimension sentinel, pixels never decoded

  out.content_hash = core::sha256_hex(bytes);
  out.bytes = std::move(bytes);
  return out;
}

}  // namespace imgpipe::vision
