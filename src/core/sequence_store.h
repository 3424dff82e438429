// viralclust - sequence_store.h
// Parsed sequences keyed by stable integer ids, with header lookup and
// genome-of-interest membership

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace viralclust {

// A record of a previously written FASTA mapped back to its store id
struct ResolvedRecord {
    int id;
    std::string sequence;
};

class SequenceStore {
public:
    // ':' and ' ' become '_'; leading/trailing '>' and '_' are stripped
    static std::string sanitize_header(const std::string& raw);

    // Uppercase, U -> T
    static std::string normalize_sequence(const std::string& raw);

    // Append every record of a FASTA file. Ids continue from the current size.
    // Returns the number of records read. Throws std::runtime_error on I/O failure.
    size_t load(const std::string& path);

    // Same as load(), flagging each record as a genome of interest
    size_t load_goi(const std::string& path);

    // Map the records of a FASTA written from this store (e.g. a cluster file)
    // back to their ids. Repeated headers resolve in occurrence order.
    // Throws std::runtime_error for a header the store does not know.
    std::vector<ResolvedRecord> resolve(const std::string& path) const;

    size_t size() const { return headers_.size(); }
    bool empty() const { return headers_.empty(); }

    const std::string& header(int id) const { return headers_.at(id); }
    const std::string& sequence(int id) const { return sequences_.at(id); }
    bool is_goi(int id) const { return goi_flags_.at(id); }
    const std::vector<int>& goi_ids() const { return goi_ids_; }

    // All ids carrying this (sanitized) header, in id order
    const std::vector<int>& ids_for(const std::string& header) const;

private:
    size_t load_records(const std::string& path, bool goi);
    int add(std::string header, std::string sequence, bool goi);

    std::vector<std::string> headers_;
    std::vector<std::string> sequences_;
    std::vector<bool> goi_flags_;
    std::vector<int> goi_ids_;
    std::unordered_map<std::string, std::vector<int>> header_ids_;
};

}  // namespace viralclust
