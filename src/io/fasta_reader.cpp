#include "fasta_reader.h"
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace viralclust {

FastaReader::FastaReader(const std::string& path)
    : path_(path), gz_file_(nullptr), has_pending_header_(false) {

    gz_file_ = gzopen(path.c_str(), "r");
    if (!gz_file_) {
        throw std::runtime_error("Failed to open FASTA file: " + path);
    }
    gzbuffer(gz_file_, 262144);  // 256KB
}

FastaReader::~FastaReader() {
    if (gz_file_) {
        gzclose(gz_file_);
    }
}

// Assemble one full line across as many gzgets() calls as it takes.
bool FastaReader::read_line(std::string& line) {
    line.clear();
    bool got_any = false;

    while (gzgets(gz_file_, buffer_, sizeof(buffer_)) != nullptr) {
        got_any = true;
        size_t len = strlen(buffer_);
        if (len > 0 && buffer_[len - 1] == '\n') {
            line.append(buffer_, len - 1);
            break;
        }
        line.append(buffer_, len);
    }

    if (!got_any) {
        int errnum = 0;
        const char* msg = gzerror(gz_file_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw std::runtime_error("Failed to read FASTA file: " + path_ + " (" + msg + ")");
        }
        return false;
    }

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool FastaReader::next(FastaRecord& record) {
    record.header.clear();
    record.sequence.clear();

    bool in_record = false;
    std::string line;

    if (has_pending_header_) {
        record.header = pending_header_;
        has_pending_header_ = false;
        in_record = true;
    }

    while (read_line(line)) {
        if (!line.empty() && line[0] == '>') {
            if (in_record) {
                // Header of the following record, keep it for the next call
                pending_header_ = line.substr(1);
                has_pending_header_ = true;
                return true;
            }
            record.header = line.substr(1);
            in_record = true;
        } else if (in_record) {
            for (char c : line) {
                if (!std::isspace(static_cast<unsigned char>(c))) {
                    record.sequence.push_back(c);
                }
            }
        }
        // Anything before the first header is ignored
    }

    return in_record;
}

}  // namespace viralclust
