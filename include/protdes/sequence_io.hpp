#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace protdes {

/**
 * Sequence record from a FASTA file
 */
struct SequenceRecord {
    std::string id;
    std::string description;
    std::string sequence;
};

/**
 * FASTA reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed (.gz, via zlib) files
 * - Multi-line records
 * - Iterator-style and callback-based processing
 */
class SequenceReader {
public:
    /**
     * Open a FASTA file. Throws std::runtime_error if it cannot be opened.
     */
    explicit SequenceReader(const std::string& filename);
    ~SequenceReader();

    /**
     * Read next record
     * Returns false at end of file
     */
    bool read_next(SequenceRecord& record);

    void for_each(std::function<void(const SequenceRecord&)> callback);

    std::vector<SequenceRecord> read_all();

    bool is_open() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * FASTA writer, 80 residues per line.
 * Output is gzip-compressed when the filename ends in ".gz".
 */
class FastaWriter {
public:
    explicit FastaWriter(const std::string& filename);
    ~FastaWriter();

    void write_sequence(const std::string& id,
                        const std::string& description,
                        const std::string& sequence);

    // Flush and close; throws std::runtime_error on a write error
    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

class SequenceUtils {
public:
    // Remove whitespace and '*' stop symbols, convert to uppercase
    static std::string clean(const std::string& seq);

    static bool has_gz_suffix(const std::string& filename);
};

} // namespace protdes
