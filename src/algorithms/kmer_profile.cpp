#include "kmer_profile.h"
#include "../util/parallel.h"

#include <atomic>
#include <stdexcept>

namespace viralclust {

KmerVocabulary::KmerVocabulary(int k) : k_(k) {
  if (k < 1 || k > 16) {
    throw std::invalid_argument("k-mer size out of range: " + std::to_string(k));
  }
  size_ = 1ULL << (2 * k);
  mask_ = size_ - 1;

  codes_.fill(255);
  codes_['A'] = codes_['a'] = 0;
  codes_['C'] = codes_['c'] = 1;
  codes_['G'] = codes_['g'] = 2;
  codes_['T'] = codes_['t'] = 3;
}

int64_t KmerVocabulary::index_of(const std::string &kmer) const {
  if (kmer.size() != static_cast<size_t>(k_))
    return -1;
  int64_t idx = 0;
  for (char c : kmer) {
    uint8_t bits = code(c);
    if (bits > 3)
      return -1;
    idx = (idx << 2) | bits;
  }
  return idx;
}

std::string KmerVocabulary::kmer_at(size_t index) const {
  static const char kBases[4] = {'A', 'C', 'G', 'T'};
  std::string kmer(k_, 'A');
  for (int i = k_ - 1; i >= 0; --i) {
    kmer[i] = kBases[index & 0x3];
    index >>= 2;
  }
  return kmer;
}

std::vector<float> KmerVocabulary::profile(const std::string &seq,
                                           size_t *valid_windows) const {
  std::vector<uint32_t> counts(size_, 0);
  size_t total = 0;

  // Rolling 2-bit code; `run` is the number of consecutive valid bases.
  // The window ending on the last base is not counted.
  uint64_t idx = 0;
  int run = 0;
  for (size_t i = 0; i + 1 < seq.size(); ++i) {
    uint8_t bits = code(seq[i]);
    if (bits > 3) {
      run = 0;
      idx = 0;
      continue;
    }
    idx = ((idx << 2) | bits) & mask_;
    if (++run >= k_) {
      counts[idx]++;
      total++;
    }
  }

  if (valid_windows)
    *valid_windows = total;

  std::vector<float> freq(size_, 0.0f);
  if (total == 0)
    return freq;

  const double denom = static_cast<double>(total);
  for (size_t j = 0; j < size_; ++j) {
    if (counts[j])
      freq[j] = static_cast<float>(counts[j] / denom);
  }
  return freq;
}

std::vector<std::vector<float>> compute_profiles(
    const std::vector<const std::string *> &seqs,
    const KmerVocabulary &vocab,
    int threads,
    size_t *zero_profiles) {

  std::vector<std::vector<float>> profiles(seqs.size());
  std::atomic<size_t> zeros{0};

  parallel_for(seqs.size(), threads, [&](size_t i) {
    size_t windows = 0;
    profiles[i] = vocab.profile(*seqs[i], &windows);
    if (windows == 0)
      zeros.fetch_add(1, std::memory_order_relaxed);
  });

  if (zero_profiles)
    *zero_profiles = zeros.load();
  return profiles;
}

} // namespace viralclust
