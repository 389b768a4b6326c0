#include "file_transfer.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace {

std::string errno_text(int err){
  return std::error_code(err, std::generic_category()).message();
}

} // namespace

FileTransferHandler::FileTransferHandler(std::filesystem::path download_dir,
                                         std::shared_ptr<Logger> logger)
  : download_dir_(std::move(download_dir)), logger_(std::move(logger))
{
  std::error_code ec;
  std::filesystem::create_directories(download_dir_, ec);
  if(ec){
    log_warn(logger_.get(), "Unable to create download directory {}: {}", download_dir_.string(), ec.message());
  }
}

std::optional<std::string> FileTransferHandler::sanitize_file_name(const std::string& file_name){
  auto name = std::filesystem::path(file_name).filename().string();
  if(name.empty() || name == "." || name == "..") return std::nullopt;
  return name;
}

std::optional<Message> FileTransferHandler::handle(const Message& message, const DeviceId& sender){
  if(auto* request = std::get_if<FileTransferRequest>(&message)) return on_request(*request, sender);
  if(auto* chunk = std::get_if<FileTransferChunk>(&message)) return on_chunk(*chunk, sender);
  if(auto* end = std::get_if<FileTransferEnd>(&message)) return on_end(*end, sender);
  if(auto* error = std::get_if<FileTransferError>(&message)) return on_error(*error, sender);
  return std::nullopt;
}

std::optional<Message> FileTransferHandler::on_request(const FileTransferRequest& request, const DeviceId& sender){
  log_info(logger_.get(), "File transfer request from {}: {} ({} bytes)", sender, request.file_name, request.file_size);

  auto name = sanitize_file_name(request.file_name);
  if(!name){
    log_warn(logger_.get(), "Refusing file name '{}' from {}", request.file_name, sender);
    return FileTransferError{request.file_name, kInvalidNameError};
  }

  auto session = std::make_shared<Session>();
  session->file_name = *name;
  session->path = download_dir_ / *name;
  session->advertised_size = request.file_size;

  errno = 0;
  session->out.open(session->path, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
  if(!session->out.is_open()){
    int err = errno ? errno : EIO;
    log_error(logger_.get(), "Failed to create file {}: {}", session->path.string(), errno_text(err));
    return FileTransferError{request.file_name, "Failed to create file: " + errno_text(err)};
  }

  {
    std::lock_guard lg(m_);
    if(sessions_.count(*name)){
      log_warn(logger_.get(), "Restarting transfer of {}", *name);
    }
    sessions_[*name] = session;
  }
  log_info(logger_.get(), "Ready to receive {}", session->path.string());
  return std::nullopt;
}

std::optional<Message> FileTransferHandler::on_chunk(const FileTransferChunk& chunk, const DeviceId& sender){
  auto name = sanitize_file_name(chunk.file_name);
  auto session = name ? find_session(*name) : nullptr;
  if(!session){
    log_debug(logger_.get(), "Chunk for {} from {} without a session, ignored", chunk.file_name, sender);
    return std::nullopt;
  }

  log_debug(logger_.get(), "Chunk for {} at {} ({} bytes) from {}", chunk.file_name, chunk.offset, chunk.chunk.size(), sender);

  std::lock_guard lg(session->m);
  auto& out = session->out;
  out.clear();
  out.seekp(static_cast<std::streamoff>(chunk.offset));
  if(!out){
    log_error(logger_.get(), "Failed to seek in {} to {}", session->path.string(), chunk.offset);
    return FileTransferError{chunk.file_name, "Seek error: offset " + std::to_string(chunk.offset)};
  }
  if(!chunk.chunk.empty()){
    out.write(reinterpret_cast<const char*>(chunk.chunk.data()), static_cast<std::streamsize>(chunk.chunk.size()));
  }
  out.flush();
  if(!out){
    int err = errno ? errno : EIO;
    log_error(logger_.get(), "Failed to write chunk to {}: {}", session->path.string(), errno_text(err));
    return FileTransferError{chunk.file_name, "Write error: " + errno_text(err)};
  }
  session->high_water = std::max<uint64_t>(session->high_water, chunk.offset + chunk.chunk.size());
  return std::nullopt;
}

std::optional<Message> FileTransferHandler::on_end(const FileTransferEnd& end, const DeviceId& sender){
  auto name = sanitize_file_name(end.file_name);
  auto session = name ? take_session(*name) : nullptr;
  if(!session){
    log_warn(logger_.get(), "End of {} from {} without a session", end.file_name, sender);
    return std::nullopt;
  }

  std::lock_guard lg(session->m);
  session->out.close();
  if(session->high_water != session->advertised_size){
    log_warn(logger_.get(), "{} finished with {} bytes, {} were announced",
             session->file_name, session->high_water, session->advertised_size);
  }
  log_info(logger_.get(), "File transfer of {} from {} complete: {}", end.file_name, sender, session->path.string());
  return std::nullopt;
}

std::optional<Message> FileTransferHandler::on_error(const FileTransferError& error, const DeviceId& sender){
  log_error(logger_.get(), "File transfer error for {} from {}: {}", error.file_name, sender, error.error);

  auto name = sanitize_file_name(error.file_name);
  if(!name) return std::nullopt;

  if(auto session = take_session(*name)){
    std::lock_guard lg(session->m);
    session->out.close();
  }

  auto path = download_dir_ / *name;
  std::error_code ec;
  if(!std::filesystem::remove(path, ec) && ec){
    log_warn(logger_.get(), "Failed to remove partial file {}: {}", path.string(), ec.message());
  }
  return std::nullopt;
}

std::shared_ptr<FileTransferHandler::Session> FileTransferHandler::find_session(const std::string& key) const {
  std::lock_guard lg(m_);
  auto it = sessions_.find(key);
  return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<FileTransferHandler::Session> FileTransferHandler::take_session(const std::string& key){
  std::lock_guard lg(m_);
  auto it = sessions_.find(key);
  if(it == sessions_.end()) return nullptr;
  auto session = it->second;
  sessions_.erase(it);
  return session;
}

bool FileTransferHandler::has_session(const std::string& file_name) const {
  auto name = sanitize_file_name(file_name);
  if(!name) return false;
  std::lock_guard lg(m_);
  return sessions_.count(*name) > 0;
}

std::size_t FileTransferHandler::active_sessions() const {
  std::lock_guard lg(m_);
  return sessions_.size();
}
