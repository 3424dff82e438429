#include "sequence_store.h"
#include "../io/fasta_reader.h"

#include <cctype>
#include <stdexcept>

namespace viralclust {

std::string SequenceStore::sanitize_header(const std::string& raw) {
    std::string header = raw;
    for (auto& c : header) {
        if (c == ':' || c == ' ') c = '_';
    }

    auto strip = [](char c) { return c == '>' || c == '_'; };
    size_t begin = 0;
    while (begin < header.size() && strip(header[begin])) ++begin;
    size_t end = header.size();
    while (end > begin && strip(header[end - 1])) --end;

    return header.substr(begin, end - begin);
}

std::string SequenceStore::normalize_sequence(const std::string& raw) {
    std::string seq;
    seq.reserve(raw.size());
    for (char c : raw) {
        char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        seq.push_back(u == 'U' ? 'T' : u);
    }
    return seq;
}

int SequenceStore::add(std::string header, std::string sequence, bool goi) {
    int id = static_cast<int>(headers_.size());
    header_ids_[header].push_back(id);
    headers_.push_back(std::move(header));
    sequences_.push_back(std::move(sequence));
    goi_flags_.push_back(goi);
    if (goi) goi_ids_.push_back(id);
    return id;
}

size_t SequenceStore::load_records(const std::string& path, bool goi) {
    FastaReader reader(path);
    FastaRecord record;
    size_t n = 0;

    while (reader.next(record)) {
        add(sanitize_header(record.header), normalize_sequence(record.sequence), goi);
        ++n;
    }
    return n;
}

size_t SequenceStore::load(const std::string& path) {
    return load_records(path, false);
}

size_t SequenceStore::load_goi(const std::string& path) {
    return load_records(path, true);
}

const std::vector<int>& SequenceStore::ids_for(const std::string& header) const {
    static const std::vector<int> kNone;
    auto it = header_ids_.find(header);
    return it == header_ids_.end() ? kNone : it->second;
}

std::vector<ResolvedRecord> SequenceStore::resolve(const std::string& path) const {
    FastaReader reader(path);
    FastaRecord record;
    std::vector<ResolvedRecord> resolved;
    std::unordered_map<std::string, size_t> seen;

    while (reader.next(record)) {
        std::string header = sanitize_header(record.header);
        const auto& ids = ids_for(header);
        size_t occurrence = seen[header]++;
        if (occurrence >= ids.size()) {
            throw std::runtime_error("Unknown sequence '" + header + "' in " + path);
        }
        resolved.push_back({ids[occurrence], normalize_sequence(record.sequence)});
    }
    return resolved;
}

}  // namespace viralclust
