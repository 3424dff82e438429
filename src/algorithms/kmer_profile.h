#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace viralclust {

// Fixed k-mer vocabulary over {A,C,G,T}^k.
// A k-mer's index is its base-4 number with A=0, C=1, G=2, T=3, so the table
// is just the per-base code array; it is built once per k and read-only after.
class KmerVocabulary {
public:
  explicit KmerVocabulary(int k);

  int k() const { return k_; }
  size_t size() const { return size_; }   // 4^k

  // 2-bit code of a base, 255 for anything outside ACGT
  uint8_t code(char c) const { return codes_[static_cast<unsigned char>(c)]; }

  // Index of a k-mer, -1 if it has the wrong length or a non-ACGT base
  int64_t index_of(const std::string &kmer) const;

  // Inverse of index_of
  std::string kmer_at(size_t index) const;

  // Normalized k-mer frequency profile of length size().
  // Windows start at 0..len-k-1; windows holding a non-ACGT base are skipped.
  // With no valid window the profile is all zeros.
  // valid_windows (optional) receives the number of windows counted.
  std::vector<float> profile(const std::string &seq,
                             size_t *valid_windows = nullptr) const;

private:
  int k_;
  size_t size_;
  uint64_t mask_;
  std::array<uint8_t, 256> codes_;
};

// Profile every sequence on `threads` workers. result[i] belongs to seqs[i].
// zero_profiles (optional) receives the number of all-zero profiles.
std::vector<std::vector<float>> compute_profiles(
    const std::vector<const std::string *> &seqs,
    const KmerVocabulary &vocab,
    int threads,
    size_t *zero_profiles = nullptr);

} // namespace viralclust
