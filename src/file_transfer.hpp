#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "capability.hpp"

// Receives files into download_dir. A FileTransferRequest opens a session
// keyed by file name, chunks are written at their offsets (any order, last
// write wins), FileTransferEnd closes the session and FileTransferError
// drops it together with the partial file.
class FileTransferHandler : public CapabilityHandler {
public:
  static constexpr const char* kInvalidNameError = "Invalid file name";

  explicit FileTransferHandler(std::filesystem::path download_dir,
                               std::shared_ptr<Logger> logger = nullptr);

  std::string name() const override { return "file-transfer"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

  bool has_session(const std::string& file_name) const;
  std::size_t active_sessions() const;
  const std::filesystem::path& download_dir() const { return download_dir_; }

  // Final path component of `file_name`; nullopt for "", "." and "..".
  static std::optional<std::string> sanitize_file_name(const std::string& file_name);

private:
  struct Session {
    std::string file_name;
    std::filesystem::path path;
    uint64_t advertised_size = 0;
    uint64_t high_water = 0;
    std::fstream out;
    std::mutex m;
  };

  std::optional<Message> on_request(const FileTransferRequest& request, const DeviceId& sender);
  std::optional<Message> on_chunk(const FileTransferChunk& chunk, const DeviceId& sender);
  std::optional<Message> on_end(const FileTransferEnd& end, const DeviceId& sender);
  std::optional<Message> on_error(const FileTransferError& error, const DeviceId& sender);

  std::shared_ptr<Session> find_session(const std::string& key) const;
  std::shared_ptr<Session> take_session(const std::string& key);

  std::filesystem::path download_dir_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};
