#include "RecordFile.h"

#include <filesystem>

namespace cb {

RecordFile::RecordFile() {}

RecordFile::~RecordFile() { close(); }

RecordFile::Roe<void> RecordFile::open(const std::string &filepath) {
  close();
  filepath_ = filepath;
  recordCount_ = 0;
  currentSize_ = 0;
  index_.clear();

  if (filepath_.empty()) {
    return Error(E_STATE, "Filepath is not set");
  }

  bool fileExists = std::filesystem::exists(filepath_);
  if (!fileExists) {
    std::ofstream create(filepath_, std::ios::binary | std::ios::out);
    if (!create.is_open()) {
      return Error(E_IO, "Failed to create file: " + filepath_);
    }
  }

  file_.open(filepath_, std::ios::binary | std::ios::in | std::ios::out);
  if (!file_.is_open()) {
    return Error(E_IO, "Failed to open file: " + filepath_);
  }

  if (!fileExists) {
    auto headerResult = writeHeader();
    if (!headerResult) {
      log().error << "Failed to write header to new file: " << filepath_;
      return headerResult.error();
    }
    currentSize_ = HEADER_SIZE;
    log().debug << "Created record file: " << filepath_;
    return {};
  }

  auto headerResult = readHeader();
  if (!headerResult) {
    log().error << "Failed to read header from file: " << filepath_;
    return headerResult.error();
  }

  std::error_code ec;
  uint64_t fileSize = std::filesystem::file_size(filepath_, ec);
  if (ec) {
    return Error(E_IO, "Failed to stat file: " + filepath_ + ": " + ec.message());
  }

  auto indexResult = buildIndex(fileSize);
  if (!indexResult) {
    return indexResult.error();
  }

  if (currentSize_ < fileSize) {
    log().warning << "Discarding " << (fileSize - currentSize_)
                  << " trailing bytes of an incomplete append in " << filepath_;
    file_.close();
    std::filesystem::resize_file(filepath_, currentSize_, ec);
    if (ec) {
      return Error(E_IO, "Failed to truncate file: " + filepath_ + ": " +
                             ec.message());
    }
    file_.open(filepath_, std::ios::binary | std::ios::in | std::ios::out);
    if (!file_.is_open()) {
      return Error(E_IO, "Failed to reopen file: " + filepath_);
    }
  }

  log().debug << "Opened record file: " << filepath_
              << " (records: " << recordCount_
              << ", size: " << currentSize_ << ")";
  return {};
}

RecordFile::Roe<std::vector<std::string>> RecordFile::readAll() {
  if (!isOpen()) {
    return Error(E_STATE, "File is not open: " + filepath_);
  }

  std::vector<std::string> records;
  records.reserve(index_.size());
  for (size_t i = 0; i < index_.size(); ++i) {
    const RecordEntry &entry = index_[i];
    std::string data(entry.size, '\0');

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(entry.offset + SIZE_PREFIX_BYTES),
                std::ios::beg);
    if (entry.size > 0) {
      file_.read(&data[0], static_cast<std::streamsize>(entry.size));
      if (file_.gcount() != static_cast<std::streamsize>(entry.size)) {
        return Error(E_IO, "Failed to read record " + std::to_string(i) +
                               " from " + filepath_);
      }
    }
    records.push_back(std::move(data));
  }
  return records;
}

RecordFile::Roe<uint64_t> RecordFile::append(const std::string &record) {
  if (!isOpen()) {
    log().error << "File is not open: " << filepath_;
    return Error(E_STATE, "File is not open: " + filepath_);
  }

  uint64_t size = record.size();
  uint64_t offset = currentSize_;

  file_.clear();
  file_.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
  file_.write(reinterpret_cast<const char *>(&size), SIZE_PREFIX_BYTES);
  if (size > 0) {
    file_.write(record.data(), static_cast<std::streamsize>(size));
  }
  file_.flush();
  if (!file_.good()) {
    log().error << "Failed to write record to file: " << filepath_;
    return Error(E_IO, "Failed to write record to file: " + filepath_);
  }

  uint64_t recordIndex = recordCount_;
  recordCount_++;
  auto headerResult = updateHeaderRecordCount();
  if (!headerResult) {
    // Without the count the bytes are ignored (and cut) on the next open
    recordCount_--;
    return headerResult.error();
  }

  index_.push_back(RecordEntry{ offset, size });
  currentSize_ += SIZE_PREFIX_BYTES + size;

  log().debug << "Appended record " << recordIndex << " (" << size
              << " bytes) to " << filepath_;
  return recordIndex;
}

bool RecordFile::isOpen() const { return file_.is_open(); }

void RecordFile::close() {
  if (file_.is_open()) {
    file_.close();
    log().debug << "Closed record file: " << filepath_
                << " (records: " << recordCount_ << ")";
  }
}

RecordFile::Roe<void> RecordFile::writeHeader() {
  header_ = FileHeader();
  header_.recordCount = 0;

  file_.seekp(0, std::ios::beg);
  file_.write(reinterpret_cast<const char *>(&header_), sizeof(FileHeader));
  file_.flush();
  if (!file_.good()) {
    return Error(E_IO, "Failed to write header to file: " + filepath_);
  }
  return {};
}

RecordFile::Roe<void> RecordFile::readHeader() {
  file_.seekg(0, std::ios::beg);
  file_.read(reinterpret_cast<char *>(&header_), sizeof(FileHeader));

  if (file_.gcount() != static_cast<std::streamsize>(sizeof(FileHeader))) {
    return Error(E_FORMAT,
                 "Failed to read complete header from file: " + filepath_);
  }

  if (header_.magic != FileHeader::MAGIC) {
    return Error(E_FORMAT, "Invalid magic number in file header: " + filepath_);
  }

  if (header_.version > FileHeader::CURRENT_VERSION) {
    return Error(E_FORMAT,
                 "Unsupported file version " + std::to_string(header_.version) +
                     " (current: " +
                     std::to_string(FileHeader::CURRENT_VERSION) + ")");
  }

  if (header_.headerSize != HEADER_SIZE) {
    return Error(E_FORMAT, "Unexpected header size in file: " + filepath_);
  }

  log().debug << "Read file header (version: " << header_.version
              << ", records: " << header_.recordCount << ")";
  return {};
}

RecordFile::Roe<void> RecordFile::buildIndex(uint64_t fileSize) {
  index_.clear();
  uint64_t offset = HEADER_SIZE;

  for (uint64_t i = 0; i < header_.recordCount; ++i) {
    if (offset + SIZE_PREFIX_BYTES > fileSize) {
      return Error(E_FORMAT, "Record " + std::to_string(i) +
                                 " is missing from " + filepath_);
    }

    uint64_t size = 0;
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    file_.read(reinterpret_cast<char *>(&size), SIZE_PREFIX_BYTES);
    if (file_.gcount() != static_cast<std::streamsize>(SIZE_PREFIX_BYTES)) {
      return Error(E_IO, "Failed to read size of record " + std::to_string(i));
    }

    if (size > fileSize - offset - SIZE_PREFIX_BYTES) {
      return Error(E_FORMAT, "Record " + std::to_string(i) +
                                 " overruns the end of " + filepath_);
    }

    index_.push_back(RecordEntry{ offset, size });
    offset += SIZE_PREFIX_BYTES + size;
  }

  recordCount_ = header_.recordCount;
  currentSize_ = offset;
  return {};
}

RecordFile::Roe<void> RecordFile::updateHeaderRecordCount() {
  file_.clear();
  file_.seekp(COUNT_OFFSET, std::ios::beg);
  file_.write(reinterpret_cast<const char *>(&recordCount_), sizeof(uint64_t));
  file_.flush();
  if (!file_.good()) {
    return Error(E_IO, "Failed to update record count in header: " + filepath_);
  }
  header_.recordCount = recordCount_;
  return {};
}

} // namespace cb
