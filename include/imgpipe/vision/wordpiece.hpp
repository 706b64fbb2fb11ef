#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace imgpipe::vision {

/// Reads a vocabulary file: one token per line, line index = token id.
/// Throws std::runtime_error if the file cannot be read or is empty.
[[nodiscard]] std::vector<std::string> load_vocabulary(const std::string& path);

/// Token ids -> text. Special tokens ("[PAD]", "[CLS]", "[SEP]", "[UNK]",
/// "[MASK]") and out-of-range ids are dropped; "##" pieces join the previous word.
[[nodiscard]] std::string decode_wordpiece(const std::vector<std::int64_t>& ids,
                                           const std::vector<std::string>& vocab);

}  // namespace imgpipe::vision
