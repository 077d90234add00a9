#ifndef CB_LEDGER_RECORD_FILE_H
#define CB_LEDGER_RECORD_FILE_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace cb {

/**
 * RecordFile - append-only file of length-prefixed records.
 *
 * File format:
 * - Header: magic, version, reserved, recordCount, headerSize
 * - Records: [size (8 bytes)][data (size bytes)]*
 *
 * The header count is rewritten after every append and is authoritative:
 * bytes past the last counted record are a torn append and are cut off on
 * open.
 */
class RecordFile : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_IO = 1;
  constexpr static int32_t E_FORMAT = 2;
  constexpr static int32_t E_STATE = 3;

  RecordFile();
  ~RecordFile() override;

  RecordFile(const RecordFile &) = delete;
  RecordFile &operator=(const RecordFile &) = delete;

  /**
   * Open a record file, creating it with an empty header when missing
   * @param filepath Path of the file
   * @return Roe<void> on success or error
   */
  Roe<void> open(const std::string &filepath);

  /**
   * Read every record in append order
   */
  Roe<std::vector<std::string>> readAll();

  /**
   * Append one record and persist the new record count
   * @return Roe<uint64_t> with the 0-based record index
   */
  Roe<uint64_t> append(const std::string &record);

  uint64_t getRecordCount() const { return recordCount_; }
  const std::string &getFilePath() const { return filepath_; }
  bool isOpen() const;

  void close();

private:
  struct FileHeader {
    static constexpr uint32_t MAGIC = 0x43425246; // "CBRF"
    static constexpr uint16_t CURRENT_VERSION = 1;

    uint32_t magic{ MAGIC };
    uint16_t version{ CURRENT_VERSION };
    uint16_t reserved{ 0 };
    uint64_t recordCount{ 0 };
    uint64_t headerSize{ sizeof(FileHeader) };
  };

  struct RecordEntry {
    uint64_t offset{ 0 }; // offset of the size prefix
    uint64_t size{ 0 };
  };

  static constexpr size_t HEADER_SIZE = sizeof(FileHeader);
  static constexpr size_t SIZE_PREFIX_BYTES = sizeof(uint64_t);
  static constexpr uint64_t COUNT_OFFSET = 8; // magic + version + reserved

  Roe<void> writeHeader();
  Roe<void> readHeader();
  Roe<void> buildIndex(uint64_t fileSize);
  Roe<void> updateHeaderRecordCount();

  std::string filepath_;
  std::fstream file_;
  FileHeader header_;
  uint64_t recordCount_{ 0 };
  uint64_t currentSize_{ 0 };
  std::vector<RecordEntry> index_;
};

} // namespace cb

#endif // CB_LEDGER_RECORD_FILE_H
