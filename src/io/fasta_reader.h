#pragma once

#include <string>
#include <zlib.h>

namespace viralclust {

// Raw FASTA record as it appears in the file
struct FastaRecord {
    std::string header;     // Header line without the leading '>'
    std::string sequence;   // Sequence lines joined, whitespace removed
};

/**
 * Streaming FASTA reader. Plain and gzip-compressed files are both read
 * through zlib (gzopen passes uncompressed input through unchanged).
 * Lines of any length are supported.
 */
class FastaReader {
public:
    explicit FastaReader(const std::string& path);
    ~FastaReader();

    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;

    // Reads the next record. Returns false at end of file.
    // Records with an empty sequence are still returned.
    bool next(FastaRecord& record);

    const std::string& path() const { return path_; }

private:
    bool read_line(std::string& line);

    std::string path_;
    gzFile gz_file_;
    char buffer_[262144];   // 256KB
    std::string pending_header_;
    bool has_pending_header_;
};

}  // namespace viralclust
