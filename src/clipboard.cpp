#include "clipboard.hpp"

#include <fstream>
#include <iterator>

#include "http_client.hpp"
#include "utils.hpp"

nlohmann::json ClipboardEntry::to_json() const {
  nlohmann::json j{
    {"text", text},
    {"senderName", sender_name},
    {"senderDeviceId", sender_device_id},
    {"timestamp", format_iso8601(timestamp)},
    {"type", kind == ClipboardKind::Image ? "image" : "text"}
  };
  j["imagePath"] = image_path.empty() ? nlohmann::json() : nlohmann::json(image_path);
  return j;
}

bool ClipboardHistory::add(const ClipboardEntry& entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!entries_.empty()) {
    const auto& last = entries_.front();
    if(last.text == entry.text && entry.timestamp - last.timestamp < kDuplicateWindow) {
      return false;
    }
  }
  entries_.insert(entries_.begin(), entry);
  if(entries_.size() > kMaxEntries) entries_.resize(kMaxEntries);
  return true;
}

void ClipboardHistory::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

bool ClipboardHistory::remove_at(std::size_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(index >= entries_.size()) return false;
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
  return true;
}

std::vector<ClipboardEntry> ClipboardHistory::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

ClipboardService::ClipboardService(LocalDeviceProvider local_device,
                                   DownloadRootProvider download_root,
                                   Options options,
                                   std::shared_ptr<Logger> logger)
  : local_device_(std::move(local_device)),
    download_root_(std::move(download_root)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("clipboard")) {}

std::shared_ptr<HttpRouter> ClipboardService::router() {
  auto router = std::make_shared<HttpRouter>();
  router->post("/api/clipboard", [this](const HttpRequest& request, const RouteParams&){
    return handle_clipboard(request);
  });
  return router;
}

HttpResponse ClipboardService::handle_clipboard(const HttpRequest& request) {
  auto doc = nlohmann::json::parse(request.body, nullptr, false);
  if(doc.is_discarded()) {
    return HttpResponse::json(400, make_error_body("Invalid JSON body"));
  }
  std::string error;
  auto message = ClipboardMessage::from_json(doc, error);
  if(!message) {
    return HttpResponse::json(400, make_error_body(error));
  }

  ClipboardEntry entry;
  entry.kind = message->kind;
  entry.text = message->text;
  entry.sender_name = message->sender;
  entry.sender_device_id = message->sender_device_id;
  entry.timestamp = WallClock::now();

  if(message->kind == ClipboardKind::Image) {
    auto bytes = base64_decode(message->image_base64);
    if(!bytes) {
      return HttpResponse::json(400, make_error_body("Invalid imageBase64"));
    }
    auto root = download_root_();
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    auto path = unique_destination(root / ("clipboard_" + std::to_string(epoch_ms_now()) + ".png"));
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
    out.close();
    if(!out) {
      logger_->error("Failed to save clipboard image to {}", path.string());
      std::filesystem::remove(path, ec);
      return HttpResponse::json(500, make_error_body("Clipboard error: could not save image"));
    }
    entry.image_path = path.string();
    logger_->info("Clipboard image from {} saved to {}", entry.sender_name, entry.image_path);
  } else {
    logger_->info("Clipboard text from {} ({} chars)", entry.sender_name, entry.text.size());
  }

  history_.add(entry);
  events_.publish(entry);

  nlohmann::json body{{"status", "copied"}};
  body["imagePath"] = entry.image_path.empty() ? nlohmann::json() : nlohmann::json(entry.image_path);
  return HttpResponse::json(200, body);
}

bool ClipboardService::push(const Device& target, const ClipboardMessage& message,
                            std::chrono::milliseconds timeout, std::string& error) {
  HttpClient client(target.ip, target.port);
  auto result = client.post_json("/api/clipboard", message.to_json(), timeout);
  if(!result.ok()) {
    error = "Clipboard transfer error: " + result.describe();
    logger_->warn("Clipboard push to {} failed: {}", target.name, result.describe());
    return false;
  }
  return true;
}

bool ClipboardService::send_text(const Device& target, const std::string& text, std::string& error) {
  if(text.empty()) {
    error = "Nothing to send";
    return false;
  }
  auto local = local_device_();
  ClipboardMessage message;
  message.kind = ClipboardKind::Text;
  message.text = text;
  message.sender = local.name;
  message.sender_device_id = local.id;
  message.timestamp = format_iso8601(WallClock::now());
  if(!push(target, message, options_.text_timeout, error)) return false;

  ClipboardEntry entry;
  entry.text = text;
  entry.sender_name = local.name;
  entry.sender_device_id = local.id;
  history_.add(entry);
  return true;
}

bool ClipboardService::send_image(const Device& target, const std::filesystem::path& image, std::string& error) {
  std::ifstream in(image, std::ios::binary);
  if(!in) {
    error = "Image not found: " + image.string();
    return false;
  }
  std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  auto local = local_device_();
  ClipboardMessage message;
  message.kind = ClipboardKind::Image;
  message.image_base64 = base64_encode(bytes);
  message.sender = local.name;
  message.sender_device_id = local.id;
  message.timestamp = format_iso8601(WallClock::now());
  return push(target, message, options_.image_timeout, error);
}

SubscriptionHandle ClipboardService::subscribe(EventChannel<ClipboardEntry>::Callback callback) {
  return events_.subscribe(std::move(callback));
}

void ClipboardService::unsubscribe(SubscriptionHandle handle) {
  events_.unsubscribe(handle);
}
