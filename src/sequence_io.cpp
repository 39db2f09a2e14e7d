#include "protdes/sequence_io.hpp"
#include "protdes/residue_tables.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <zlib.h>

namespace protdes {

// Large zlib buffer for better throughput
constexpr size_t GZBUF_SIZE = 1024 * 1024;

bool SequenceUtils::has_gz_suffix(const std::string& filename) {
    return filename.size() > 3 && filename.compare(filename.size() - 3, 3, ".gz") == 0;
}

std::string SequenceUtils::clean(const std::string& seq) {
    std::string out;
    out.reserve(seq.size());
    for (char c : seq) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '*') continue;
        out.push_back(fast_upper(c));
    }
    return out;
}

// SequenceReader implementation
class SequenceReader::Impl {
public:
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    bool is_gzipped_ = false;
    char buffer_[65536];
    std::string lookahead_line_;  // next header, read past the previous record
    bool has_lookahead_ = false;

    bool open(const std::string& filename) {
        if (SequenceUtils::has_gz_suffix(filename)) {
            is_gzipped_ = true;
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GZBUF_SIZE);
            return true;
        }
        file_.open(filename);
        return static_cast<bool>(file_);
    }

    bool getline(std::string& line) {
        if (!is_gzipped_) {
            if (!std::getline(file_, line)) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        // gzgets stops at buffer size; stitch long lines together
        line.clear();
        bool got_any = false;
        while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
            got_any = true;
            size_t len = std::strlen(buffer_);
            const bool complete = len > 0 && buffer_[len - 1] == '\n';
            if (complete) --len;
            line.append(buffer_, len);
            if (complete) break;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return got_any;
    }

    bool is_open() const {
        return is_gzipped_ ? gz_file_ != nullptr : file_.is_open();
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (file_.is_open()) file_.close();
    }

    ~Impl() {
        close();
    }
};

SequenceReader::SequenceReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
}

SequenceReader::~SequenceReader() = default;

bool SequenceReader::read_next(SequenceRecord& record) {
    std::string line;
    if (impl_->has_lookahead_) {
        line = std::move(impl_->lookahead_line_);
        impl_->has_lookahead_ = false;
    } else if (!impl_->getline(line)) {
        return false;
    }

    while (line.empty()) {
        if (!impl_->getline(line)) return false;
    }
    if (line[0] != '>') {
        throw std::runtime_error("Malformed FASTA: expected '>' header, got: " +
                                 line.substr(0, 40));
    }

    const char* hdr = line.c_str() + 1;
    const char* space = std::strchr(hdr, ' ');
    if (space) {
        record.id.assign(hdr, space - hdr);
        record.description.assign(space + 1);
    } else {
        record.id.assign(hdr);
        record.description.clear();
    }

    record.sequence.clear();
    while (impl_->getline(line)) {
        if (line.empty()) continue;
        if (line[0] == '>') {
            impl_->lookahead_line_ = std::move(line);
            impl_->has_lookahead_ = true;
            break;
        }
        record.sequence += line;
    }
    return true;
}

void SequenceReader::for_each(std::function<void(const SequenceRecord&)> callback) {
    SequenceRecord record;
    while (read_next(record)) {
        callback(record);
    }
}

std::vector<SequenceRecord> SequenceReader::read_all() {
    std::vector<SequenceRecord> records;
    SequenceRecord record;
    while (read_next(record)) {
        records.push_back(record);
    }
    return records;
}

bool SequenceReader::is_open() const {
    return impl_->is_open();
}

// FastaWriter implementation
class FastaWriter::Impl {
public:
    std::ofstream file_;
    gzFile gz_file_ = nullptr;
    std::string filename_;

    void write(const char* data, size_t len) {
        if (gz_file_) {
            if (len > 0 && gzwrite(gz_file_, data, static_cast<unsigned>(len)) == 0) {
                throw std::runtime_error("Failed to write to " + filename_);
            }
        } else {
            file_.write(data, static_cast<std::streamsize>(len));
        }
    }

    void write(const std::string& str) {
        write(str.data(), str.size());
    }
};

FastaWriter::FastaWriter(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    impl_->filename_ = filename;
    if (SequenceUtils::has_gz_suffix(filename)) {
        impl_->gz_file_ = gzopen(filename.c_str(), "wb");
        if (!impl_->gz_file_) {
            throw std::runtime_error("Failed to open FASTA file: " + filename);
        }
        gzbuffer(impl_->gz_file_, GZBUF_SIZE);
        return;
    }

    impl_->file_.open(filename);
    if (!impl_->file_) {
        throw std::runtime_error("Failed to open FASTA file: " + filename);
    }
}

FastaWriter::~FastaWriter() {
    if (!impl_) return;
    if (impl_->gz_file_) {
        gzclose(impl_->gz_file_);
        impl_->gz_file_ = nullptr;
    } else if (impl_->file_.is_open()) {
        impl_->file_.close();
    }
}

void FastaWriter::write_sequence(const std::string& id,
                                 const std::string& description,
                                 const std::string& sequence) {
    impl_->write(">", 1);
    impl_->write(id);
    if (!description.empty()) {
        impl_->write(" ", 1);
        impl_->write(description);
    }
    impl_->write("\n", 1);

    const char* seq_data = sequence.c_str();
    const size_t seq_len = sequence.length();
    for (size_t i = 0; i < seq_len; i += 80) {
        const size_t line_len = std::min(size_t(80), seq_len - i);
        impl_->write(seq_data + i, line_len);
        impl_->write("\n", 1);
    }
}

void FastaWriter::close() {
    if (impl_->gz_file_) {
        const int rc = gzclose(impl_->gz_file_);
        impl_->gz_file_ = nullptr;
        if (rc != Z_OK) {
            throw std::runtime_error("Failed to finish gzip stream: " + impl_->filename_);
        }
    } else if (impl_->file_.is_open()) {
        impl_->file_.close();
        if (impl_->file_.fail()) {
            throw std::runtime_error("Failed to write FASTA file: " + impl_->filename_);
        }
    }
}

} // namespace protdes
