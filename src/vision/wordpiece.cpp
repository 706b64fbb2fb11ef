#include <imgpipe/vision/wordpiece.hpp>
#include <array>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace imgpipe::vision {

namespace {

constexpr std::array<std::string_view, 5> kSpecialTokens{"[PAD]", "[CLS]", "[SEP]", "[UNK]", "[MASK]"};

bool is_special(std::string_view token) {
  for (const auto s : kSpecialTokens) {
    if (token == s) return true;
  }
  return false;
}

}  // namespace

std::vector<std::string> load_vocabulary(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("load_vocabulary: cannot open " + path);
  }
  std::vector<std::string> vocab;
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    vocab.push_back(line);
  }
  if (vocab.empty()) {
    throw std::runtime_error("load_vocabulary: empty vocabulary " + path);
  }
  return vocab;
}

std::string decode_wordpiece(const std::vector<std::int64_t>& ids,
                             const std::vector<std::string>& vocab) {
  std::string out;
  for (const std::int64_t id : ids) {
    if (id < 0 || static_cast<std::size_t>(id) >= vocab.size()) continue;
    const std::string& token = vocab[static_cast<std::size_t>(id)];
    if (token.empty() || is_special(token)) continue;

    if (token.rfind("##", 0) == 0) {
      out += token.substr(2);
    } else {
      if (!out.empty()) out += ' ';
      out += token;
    }
  }
  return out;
}

}  // namespace imgpipe::vision
