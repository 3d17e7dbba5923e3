#include "sync_receiver.hpp"

#include <fstream>

#include "multipart.hpp"
#include "protocol.hpp"
#include "time_utils.hpp"
#include "utils.hpp"

class SyncUploadSink : public UploadSink {
public:
  SyncUploadSink(SyncReceiver& receiver,
                 std::string boundary,
                 std::string sender_name,
                 std::string relative_path,
                 std::filesystem::path destination)
    : receiver_(receiver),
      sender_name_(std::move(sender_name)),
      relative_path_(std::move(relative_path)),
      destination_(std::move(destination)),
      temp_path_(destination_.string() + ".tmp"),
      parser_(std::move(boundary), MultipartParser::Callbacks{
        [this](const HttpHeaders&){ return begin_part(); },
        [this](const char* data, std::size_t size){ return write_part(data, size); },
        [this]{ return end_part(); }
      }) {}

  bool write(const char* data, std::size_t size) override {
    if(!parser_.feed(data, size)) {
      if(failure_.empty()) failure_ = "Malformed multipart body";
      return false;
    }
    return true;
  }

  HttpResponse finish(uint64_t received, bool complete) override {
    if(out_.is_open()) out_.close();
    std::error_code ec;
    if(!failure_.empty() || !complete || !parser_.done() || !stored_) {
      std::filesystem::remove(temp_path_, ec);
      if(!complete && failure_.empty()) {
        receiver_.logger_->warn("Sync upload of {} from {} dropped after {} bytes",
                                relative_path_, sender_name_, received);
        return HttpResponse::json(500, make_error_body("Sync upload failed: connection lost"));
      }
      auto reason = failure_.empty() ? std::string("Expected a file part") : failure_;
      receiver_.logger_->warn("Sync upload of {} from {} rejected: {}", relative_path_, sender_name_, reason);
      return HttpResponse::json(failure_.rfind("Sync upload failed", 0) == 0 ? 500 : 400, make_error_body(reason));
    }

    std::filesystem::rename(temp_path_, destination_, ec);
    if(ec) {
      std::error_code ignored;
      std::filesystem::remove(temp_path_, ignored);
      receiver_.logger_->error("Could not store {}: {}", destination_.string(), ec.message());
      return HttpResponse::json(500, make_error_body("Sync upload failed: " + ec.message()));
    }

    receiver_.logger_->info("Synced file {} from {}", relative_path_, sender_name_);
    receiver_.events_.publish(SyncActivity{SyncActivity::Kind::Received, sender_name_, relative_path_,
                                           destination_, bytes_});
    return HttpResponse::json(200, nlohmann::json{{"status", "synced"}, {"path", destination_.string()}});
  }

private:
  bool begin_part() {
    // only the first part carries the file
    if(stored_ || out_.is_open()) {
      skipping_ = true;
      return true;
    }
    out_.open(temp_path_, std::ios::binary | std::ios::trunc);
    if(!out_) {
      failure_ = "Sync upload failed: cannot write " + temp_path_.string();
      return false;
    }
    return true;
  }

  bool write_part(const char* data, std::size_t size) {
    if(skipping_) return true;
    out_.write(data, static_cast<std::streamsize>(size));
    if(!out_) {
      failure_ = "Sync upload failed: write error";
      return false;
    }
    bytes_ += size;
    return true;
  }

  bool end_part() {
    if(skipping_) {
      skipping_ = false;
      return true;
    }
    out_.close();
    if(!out_) {
      failure_ = "Sync upload failed: write error";
      return false;
    }
    stored_ = true;
    return true;
  }

  SyncReceiver& receiver_;
  std::string sender_name_;
  std::string relative_path_;
  std::filesystem::path destination_;
  std::filesystem::path temp_path_;
  std::ofstream out_;
  MultipartParser parser_;
  std::string failure_;
  uint64_t bytes_ = 0;
  bool stored_ = false;
  bool skipping_ = false;
};

SyncReceiver::SyncReceiver(DownloadRootProvider download_root, std::shared_ptr<Logger> logger)
  : download_root_(std::move(download_root)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-receiver")) {}

std::shared_ptr<HttpRouter> SyncReceiver::router() {
  auto router = std::make_shared<HttpRouter>();
  router->post_stream("/api/sync/upload", [this](const HttpRequest& request, const RouteParams&){
    return begin_upload(request);
  });
  router->post("/api/sync/delete", [this](const HttpRequest& request, const RouteParams&){
    return handle_delete(request);
  });
  router->get("/api/sync/check", [this](const HttpRequest& request, const RouteParams&){
    return handle_check(request);
  });
  return router;
}

std::filesystem::path SyncReceiver::sync_root(const std::string& sender_name) const {
  return download_root_() / "Sync" / sender_name;
}

std::optional<std::filesystem::path> SyncReceiver::resolve(const std::string& sender_name,
                                                           const std::string& relative_path,
                                                           std::string& error) const {
  if(!is_safe_component(sender_name)) {
    error = "Invalid sender name";
    return std::nullopt;
  }
  auto resolved = resolve_under(sync_root(sender_name), relative_path);
  if(!resolved) {
    error = "Invalid file path";
    return std::nullopt;
  }
  return resolved;
}

StreamStart SyncReceiver::begin_upload(const HttpRequest& request) {
  StreamStart start;
  auto boundary = multipart_boundary(request.header("content-type"));
  if(!boundary) {
    start.response = HttpResponse::json(400, make_error_body("Expected multipart request"));
    return start;
  }
  auto raw_path = request.header(kSyncPathHeader);
  if(raw_path.empty()) {
    start.response = HttpResponse::json(400, make_error_body("Missing X-Sync-Path header"));
    return start;
  }
  auto relative_path = url_decode(raw_path);
  auto sender_name = url_decode(request.header(kDeviceNameHeader));
  if(sender_name.empty()) sender_name = "Unknown";

  std::string error;
  auto destination = resolve(sender_name, relative_path, error);
  if(!destination) {
    logger_->warn("Rejected sync upload {} from {}: {}", relative_path, sender_name, error);
    start.response = HttpResponse::json(403, make_error_body(error));
    return start;
  }
  std::error_code ec;
  std::filesystem::create_directories(destination->parent_path(), ec);
  if(ec) {
    start.response = HttpResponse::json(500, make_error_body("Sync upload failed: " + ec.message()));
    return start;
  }
  start.sink = std::make_shared<SyncUploadSink>(*this, *boundary, sender_name, relative_path, *destination);
  return start;
}

HttpResponse SyncReceiver::handle_delete(const HttpRequest& request) {
  auto doc = nlohmann::json::parse(request.body, nullptr, false);
  if(doc.is_discarded()) {
    return HttpResponse::json(400, make_error_body("Invalid JSON body"));
  }
  std::string error;
  auto req = SyncDeleteRequest::from_json(doc, error);
  if(!req) return HttpResponse::json(400, make_error_body(error));

  auto target = resolve(req->sender_name, req->relative_path, error);
  if(!target) {
    logger_->warn("Rejected sync delete {} from {}: {}", req->relative_path, req->sender_name, error);
    return HttpResponse::json(403, make_error_body(error));
  }

  std::error_code ec;
  if(std::filesystem::exists(*target, ec)) {
    std::filesystem::remove_all(*target, ec);
    if(ec) {
      logger_->error("Sync delete of {} failed: {}", target->string(), ec.message());
      return HttpResponse::json(500, make_error_body("Sync delete failed: " + ec.message()));
    }
    logger_->info("Sync-deleted {} from {}", req->relative_path, req->sender_name);
    events_.publish(SyncActivity{SyncActivity::Kind::Deleted, req->sender_name, req->relative_path, *target, 0});
  }
  return HttpResponse::json(200, nlohmann::json{{"status", "deleted"}, {"path", target->string()}});
}

HttpResponse SyncReceiver::handle_check(const HttpRequest& request) {
  auto path_it = request.query.find("path");
  if(path_it == request.query.end() || path_it->second.empty()) {
    return HttpResponse::json(400, make_error_body("Missing path"));
  }
  std::string sender_name = "Unknown";
  if(auto it = request.query.find("sender"); it != request.query.end() && !it->second.empty()) {
    sender_name = it->second;
  }

  std::string error;
  auto target = resolve(sender_name, path_it->second, error);
  if(!target) return HttpResponse::json(403, make_error_body(error));

  SyncCheckResult result;
  std::error_code ec;
  if(std::filesystem::is_regular_file(*target, ec)) {
    auto size = std::filesystem::file_size(*target, ec);
    auto modified = file_mtime_ms(target->string());
    if(!ec && modified) {
      result.exists = true;
      result.size = size;
      result.last_modified_ms = *modified;
    }
  }
  return HttpResponse::json(200, result.to_json());
}

SubscriptionHandle SyncReceiver::subscribe(EventChannel<SyncActivity>::Callback callback) {
  return events_.subscribe(std::move(callback));
}

void SyncReceiver::unsubscribe(SubscriptionHandle handle) {
  events_.unsubscribe(handle);
}
