#include "sync_engine.hpp"

#include <algorithm>
#include <fstream>

#include "protocol.hpp"
#include "utils.hpp"

namespace {

std::string relative_of(const std::string& source, const std::filesystem::path& file) {
  return to_portable_path(file.lexically_relative(std::filesystem::path(source)));
}

SyncFileItem& item_for(SyncJob& job, const std::string& relative_path) {
  auto it = std::find_if(job.file_items.begin(), job.file_items.end(),
                         [&](const SyncFileItem& item){ return item.relative_path == relative_path; });
  if(it != job.file_items.end()) return *it;
  SyncFileItem item;
  item.relative_path = relative_path;
  job.file_items.push_back(std::move(item));
  return job.file_items.back();
}

void update_speed(SyncJob& job) {
  if(!job.sync_start_time) return;
  auto elapsed = std::chrono::duration<double>(WallClock::now() - *job.sync_start_time).count();
  if(elapsed > 0.0) job.speed = static_cast<double>(job.transferred_bytes) / elapsed;
}

} // namespace

SyncEngine::SyncEngine(std::shared_ptr<SyncClient> client,
                       DeviceResolver resolver,
                       Options options,
                       std::shared_ptr<Logger> logger)
  : client_(std::move(client)),
    resolver_(std::move(resolver)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-engine")),
    scheduler_([this](const std::string& id){ on_schedule_fire(id); }, logger_) {}

SyncEngine::~SyncEngine() {
  stop();
}

void SyncEngine::start() {
  load();
  scheduler_.start();
}

void SyncEngine::stop() {
  scheduler_.stop();
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& [id, rt] : jobs_) ids.push_back(id);
  }
  for(const auto& id : ids) {
    teardown(id);
    std::lock_guard<std::mutex> lock(mutex_);
    if(auto* rt = find(id)) {
      set_phase(rt->job, SyncPhase::Idle);
      rt->pending.clear();
      rt->flush_at.reset();
    }
  }
}

SyncEngine::Runtime* SyncEngine::find(const std::string& id) {
  auto it = jobs_.find(id);
  return it == jobs_.end() ? nullptr : it->second.get();
}

const SyncEngine::Runtime* SyncEngine::find(const std::string& id) const {
  auto it = jobs_.find(id);
  return it == jobs_.end() ? nullptr : it->second.get();
}

bool SyncEngine::running_phase(SyncPhase phase) {
  return phase == SyncPhase::Syncing || phase == SyncPhase::Watching || phase == SyncPhase::Paused;
}

bool SyncEngine::set_phase(SyncJob& job, SyncPhase to) {
  if(job.phase == to) return true;
  if(!sync_phase_transition_allowed(job.phase, to)) {
    logger_->warn("Sync job {}: rejected phase change {} -> {}", job.name, to_string(job.phase), to_string(to));
    return false;
  }
  logger_->debug("Sync job {}: {} -> {}", job.name, to_string(job.phase), to_string(to));
  job.phase = to;
  return true;
}

void SyncEngine::publish(const std::string& id) {
  std::optional<SyncJob> snapshot = job(id);
  if(snapshot) events_.publish(*snapshot);
}

std::optional<SyncJob> SyncEngine::create_job(const std::string& name,
                                              const std::filesystem::path& source_directory,
                                              const Device& target,
                                              std::optional<SyncSchedule> schedule,
                                              std::string& error) {
  std::error_code ec;
  if(!std::filesystem::is_directory(source_directory, ec)) {
    error = "Source directory does not exist: " + source_directory.string();
    return std::nullopt;
  }
  if(target.id.empty()) {
    error = "Target device is required";
    return std::nullopt;
  }
  if(schedule && !schedule->validate(error)) return std::nullopt;

  auto source = std::filesystem::absolute(source_directory, ec).lexically_normal().string();
  if(source.size() > 1 && source.back() == '/') source.pop_back();

  SyncJob job;
  job.id = "sync_" + random_uuid();
  job.name = name.empty() ? std::filesystem::path(source).filename().string() : name;
  job.source_directory = source;
  job.target_device_id = target.id;
  job.target_device_name = target.name;
  job.target_device_ip = target.ip;
  job.schedule = schedule;
  job.created_at = WallClock::now();
  job.status = "Ready";

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& [id, rt] : jobs_) {
      if(rt->job.source_directory == source && rt->job.target_device_id == target.id) {
        error = "A sync job for this folder and device already exists";
        return std::nullopt;
      }
    }
    auto rt = std::make_unique<Runtime>();
    rt->job = job;
    rt->target = target;
    jobs_.emplace(job.id, std::move(rt));
  }
  logger_->info("Created sync job {} ({} -> {})", job.name, source, target.name);
  if(schedule && schedule->enabled) scheduler_.arm(job.id, *schedule);
  save();
  events_.publish(job);
  return job;
}

bool SyncEngine::delete_job(const std::string& id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!find(id)) return false;
  }
  scheduler_.disarm(id);
  teardown(id);
  SyncJob removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if(it == jobs_.end()) return false;
    removed = it->second->job;
    jobs_.erase(it);
  }
  removed.phase = SyncPhase::Idle;
  removed.status = "Deleted";
  logger_->info("Deleted sync job {}", removed.name);
  save();
  events_.publish(removed);
  return true;
}

void SyncEngine::teardown(const std::string& id) {
  std::unique_ptr<DirectoryWatcher> watcher;
  std::thread worker;
  CancellationTokenPtr token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt) return;
    rt->stopping = true;
    token = rt->token;
    watcher = std::move(rt->watcher);
    worker = std::move(rt->worker);
    rt->cv.notify_all();
  }
  if(token) token->cancel();
  if(watcher) watcher->stop();
  if(worker.joinable()) worker.join();
}

bool SyncEngine::start_job(const std::string& id, std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt) {
      error = "Unknown sync job: " + id;
      return false;
    }
    if(running_phase(rt->job.phase)) return true;
  }
  // a previous run that ended in error may still own its watcher
  teardown(id);

  std::string source;
  std::string device_id;
  Device cached;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt) {
      error = "Unknown sync job: " + id;
      return false;
    }
    if(running_phase(rt->job.phase)) return true;
    if(!set_phase(rt->job, SyncPhase::Syncing)) {
      error = std::string("Cannot start from ") + to_string(rt->job.phase);
      return false;
    }
    rt->stopping = false;
    rt->token = CancellationToken::create();
    rt->job.status = "Connecting";
    source = rt->job.source_directory;
    device_id = rt->job.target_device_id;
    cached = rt->target;
    cached.id = device_id;
    cached.name = rt->job.target_device_name;
    if(cached.ip.empty()) cached.ip = rt->job.target_device_ip;
    if(cached.port == 0) cached.port = kDefaultTransferPort;
  }
  publish(id);

  auto fail = [&](const std::string& reason) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(auto* rt = find(id)) {
        set_phase(rt->job, SyncPhase::Error);
        rt->job.status = reason;
      }
    }
    logger_->warn("Sync job {} failed to start: {}", id, reason);
    error = reason;
    publish(id);
    return false;
  };

  std::error_code ec;
  if(!std::filesystem::is_directory(source, ec)) {
    return fail("Source directory does not exist: " + source);
  }

  Device target = cached;
  if(resolver_) {
    if(auto live = resolver_(device_id)) target = *live;
  }
  if(target.ip.empty()) return fail("Target device address is unknown");
  if(!client_->ping(target)) return fail("Target device is not reachable");

  std::vector<std::filesystem::path> files;
  for(auto it = std::filesystem::recursive_directory_iterator(source, ec);
      !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if(it->is_regular_file(type_ec)) files.push_back(it->path());
  }
  if(ec) return fail("Cannot read source directory: " + ec.message());

  auto watcher = std::make_unique<DirectoryWatcher>(
    source, [this, id](const WatchEvent& event){ on_watch_event(id, event); }, logger_);
  std::string watch_error;
  if(!watcher->start(watch_error)) return fail(watch_error);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt || rt->job.phase != SyncPhase::Syncing || rt->stopping) {
      error = "Sync job was stopped while starting";
      return false;
    }
    auto& job = rt->job;
    rt->target = target;
    job.target_device_ip = target.ip;
    job.target_device_name = target.name.empty() ? job.target_device_name : target.name;
    job.file_items.clear();
    job.failed_files.clear();
    job.synced_count = job.failed_count = job.skipped_count = 0;
    job.total_bytes = job.transferred_bytes = 0;
    job.speed = 0.0;
    job.status = "Scanning " + std::to_string(files.size()) + " files";
    rt->pending.insert(files.begin(), files.end());
    rt->flush_at = std::chrono::steady_clock::now() + options_.initial_debounce;
    rt->last_liveness_check = std::chrono::steady_clock::now();
    rt->files_since_check = 0;
    rt->skip_requests.clear();
    rt->watcher = std::move(watcher);
    rt->worker = std::thread([this, id]{ run_job(id); });
  }
  logger_->info("Started sync job {} ({} files)", id, files.size());
  publish(id);
  return true;
}

bool SyncEngine::stop_job(const std::string& id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!find(id)) return false;
  }
  teardown(id);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt) return false;
    set_phase(rt->job, SyncPhase::Idle);
    rt->job.status = "Stopped";
    rt->pending.clear();
    rt->flush_at.reset();
    for(auto& item : rt->job.file_items) {
      if(item.status == SyncFileStatus::Syncing || item.status == SyncFileStatus::Paused) {
        item.status = SyncFileStatus::Pending;
      }
    }
  }
  logger_->info("Stopped sync job {}", id);
  publish(id);
  return true;
}

bool SyncEngine::pause_job(const std::string& id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt || rt->job.phase != SyncPhase::Syncing) return false;
    if(!set_phase(rt->job, SyncPhase::Paused)) return false;
    rt->job.status = "Paused";
    for(auto& item : rt->job.file_items) {
      if(item.status == SyncFileStatus::Pending) item.status = SyncFileStatus::Paused;
    }
  }
  publish(id);
  return true;
}

bool SyncEngine::resume_job(const std::string& id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt || rt->job.phase != SyncPhase::Paused) return false;
    if(!set_phase(rt->job, SyncPhase::Syncing)) return false;
    rt->job.status = "Resuming";
    for(auto& item : rt->job.file_items) {
      if(item.status == SyncFileStatus::Paused) item.status = SyncFileStatus::Pending;
    }
    rt->cv.notify_all();
  }
  publish(id);
  return true;
}

bool SyncEngine::skip_file(const std::string& id, const std::string& relative_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* rt = find(id);
  if(!rt || relative_path.empty()) return false;
  rt->skip_requests.insert(relative_path);
  return true;
}

bool SyncEngine::update_schedule(const std::string& id, std::optional<SyncSchedule> schedule, std::string& error) {
  if(schedule && !schedule->validate(error)) return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt) {
      error = "Unknown sync job: " + id;
      return false;
    }
    rt->job.schedule = schedule;
  }
  if(schedule && schedule->enabled) {
    scheduler_.arm(id, *schedule);
  } else {
    scheduler_.disarm(id);
  }
  save();
  publish(id);
  return true;
}

bool SyncEngine::rename_job(const std::string& id, const std::string& name) {
  if(name.empty()) return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt) return false;
    rt->job.name = name;
  }
  save();
  publish(id);
  return true;
}

std::vector<SyncJob> SyncEngine::jobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SyncJob> out;
  out.reserve(jobs_.size());
  for(const auto& [id, rt] : jobs_) out.push_back(rt->job);
  std::sort(out.begin(), out.end(), [](const SyncJob& a, const SyncJob& b){ return a.created_at < b.created_at; });
  return out;
}

std::optional<SyncJob> SyncEngine::job(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* rt = find(id);
  if(!rt) return std::nullopt;
  return rt->job;
}

void SyncEngine::on_schedule_fire(const std::string& id) {
  std::string skip_reason;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt) return;
    std::error_code ec;
    if(running_phase(rt->job.phase)) {
      skip_reason = "Scheduled sync skipped: job is already running";
    } else if(!std::filesystem::is_directory(rt->job.source_directory, ec)) {
      skip_reason = "Scheduled sync skipped: source directory not found";
    }
    if(!skip_reason.empty()) rt->job.status = skip_reason;
  }
  if(!skip_reason.empty()) {
    logger_->warn("Sync job {}: {}", id, skip_reason);
    publish(id);
    return;
  }
  logger_->info("Scheduled sync of job {}", id);
  std::string error;
  if(!start_job(id, error)) {
    logger_->warn("Scheduled sync of job {} failed: {}", id, error);
  }
}

void SyncEngine::run_job(const std::string& id) {
  std::unique_lock<std::mutex> lock(mutex_);
  for(;;) {
    auto* rt = find(id);
    if(!rt || rt->stopping) return;
    if(rt->pending.empty() || !rt->flush_at) {
      rt->cv.wait(lock);
      continue;
    }
    if(std::chrono::steady_clock::now() < *rt->flush_at) {
      rt->cv.wait_until(lock, *rt->flush_at);
      continue;
    }

    std::vector<std::filesystem::path> batch(rt->pending.begin(), rt->pending.end());
    rt->pending.clear();
    rt->flush_at.reset();
    if(rt->job.phase == SyncPhase::Watching) set_phase(rt->job, SyncPhase::Syncing);
    lock.unlock();

    auto result = process_batch(id, batch);
    if(result == BatchResult::Done && !wait_while_paused(id)) return;

    lock.lock();
    rt = find(id);
    if(!rt || rt->stopping || result == BatchResult::Cancelled) return;
    if(result == BatchResult::Unreachable) {
      set_phase(rt->job, SyncPhase::Error);
      rt->job.status = "Target device is not reachable";
      lock.unlock();
      logger_->error("Sync job {}: target device is not reachable", id);
      publish(id);
      return;
    }
    if(rt->pending.empty()) {
      auto& job = rt->job;
      set_phase(job, SyncPhase::Watching);
      job.last_sync_time = WallClock::now();
      job.status = fmt::format("Synced {} files, {} skipped, {} failed",
                               job.synced_count, job.skipped_count, job.failed_count);
      lock.unlock();
      logger_->info("Sync job {}: batch finished", id);
      publish(id);
      save();
      lock.lock();
    }
  }
}

SyncEngine::BatchResult SyncEngine::process_batch(const std::string& id,
                                                  const std::vector<std::filesystem::path>& batch) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt || rt->stopping) return BatchResult::Cancelled;
    auto& job = rt->job;
    job.total_bytes = 0;
    job.transferred_bytes = 0;
    job.synced_count = job.failed_count = job.skipped_count = 0;
    job.speed = 0.0;
    job.sync_start_time = WallClock::now();
    for(const auto& file : batch) {
      std::error_code ec;
      auto size = std::filesystem::file_size(file, ec);
      auto& item = item_for(job, relative_of(job.source_directory, file));
      item.status = job.phase == SyncPhase::Paused ? SyncFileStatus::Paused : SyncFileStatus::Pending;
      item.file_size = ec ? 0 : size;
      item.error.clear();
      job.total_bytes += item.file_size;
    }
    if(job.phase == SyncPhase::Syncing) {
      job.status = "Syncing " + std::to_string(batch.size()) + " files";
    }
  }
  publish(id);

  for(const auto& file : batch) {
    auto result = sync_file(id, file);
    if(result != BatchResult::Done) return result;
  }
  return BatchResult::Done;
}

bool SyncEngine::wait_while_paused(const std::string& id) {
  std::unique_lock<std::mutex> lock(mutex_);
  for(;;) {
    auto* rt = find(id);
    if(!rt || rt->stopping) return false;
    if(rt->job.phase != SyncPhase::Paused) return true;
    rt->cv.wait_for(lock, options_.pause_poll);
  }
}

bool SyncEngine::target_alive(const std::string& id) {
  Device target;
  CancellationTokenPtr token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt) return false;
    target = rt->target;
    token = rt->token;
    rt->files_since_check = 0;
    rt->last_liveness_check = std::chrono::steady_clock::now();
  }
  if(client_->ping(target)) return true;

  for(auto delay : options_.reconnect_delays) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(auto* rt = find(id)) {
        rt->job.status = fmt::format("Connection lost, retrying in {}s",
                                     std::chrono::duration_cast<std::chrono::seconds>(delay).count());
      }
    }
    publish(id);
    logger_->warn("Sync job {}: {} not responding, pinging again in {} ms", id, target.name, delay.count());
    if(token && token->wait_for(delay)) return false;
    if(client_->ping(target)) {
      logger_->info("Sync job {}: {} reachable again", id, target.name);
      return true;
    }
  }
  return false;
}

SyncEngine::BatchResult SyncEngine::sync_file(const std::string& id, const std::filesystem::path& file) {
  if(!wait_while_paused(id)) return BatchResult::Cancelled;

  std::string rel;
  Device target;
  CancellationTokenPtr token;
  bool skip_requested = false;
  bool check_liveness = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rt = find(id);
    if(!rt || rt->stopping) return BatchResult::Cancelled;
    rel = relative_of(rt->job.source_directory, file);
    target = rt->target;
    token = rt->token;
    if(rt->skip_requests.erase(rel) > 0) {
      skip_requested = true;
      auto& item = item_for(rt->job, rel);
      item.status = SyncFileStatus::Skipped;
      rt->job.skipped_count++;
    } else {
      rt->files_since_check++;
      // checked on every liveness_every-th file, once the interval has passed
      if(options_.liveness_every > 0 && rt->files_since_check >= options_.liveness_every) {
        rt->files_since_check = 0;
        auto since = std::chrono::steady_clock::now() - rt->last_liveness_check;
        check_liveness = since >= options_.liveness_interval;
      }
    }
  }
  if(skip_requested) {
    logger_->info("Sync job {}: skipped {} on request", id, rel);
    publish(id);
    return BatchResult::Done;
  }
  if(check_liveness && !target_alive(id)) {
    return token && token->cancelled() ? BatchResult::Cancelled : BatchResult::Unreachable;
  }

  std::error_code ec;
  bool regular = std::filesystem::is_regular_file(file, ec);
  auto size = regular ? std::filesystem::file_size(file, ec) : 0;
  if(!regular || ec) {
    // removed after it was queued; the delete already went out
    std::lock_guard<std::mutex> lock(mutex_);
    if(auto* rt = find(id)) {
      auto& items = rt->job.file_items;
      items.erase(std::remove_if(items.begin(), items.end(),
                                 [&](const SyncFileItem& item){ return item.relative_path == rel; }),
                  items.end());
    }
    return BatchResult::Done;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(auto* rt = find(id)) {
      item_for(rt->job, rel).status = SyncFileStatus::Syncing;
      rt->job.status = "Syncing " + rel;
    }
  }
  publish(id);

  auto local_mtime = file_mtime_ms(file.string());
  auto remote = client_->check(target, rel);
  if(remote && remote->exists && remote->size == size && local_mtime &&
     remote->last_modified_ms >= *local_mtime) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(auto* rt = find(id)) {
        auto& item = item_for(rt->job, rel);
        item.status = SyncFileStatus::Skipped;
        item.completed_at = WallClock::now();
        rt->job.skipped_count++;
        rt->job.transferred_bytes += size;
        update_speed(rt->job);
      }
    }
    logger_->debug("Sync job {}: {} is up to date", id, rel);
    publish(id);
    return BatchResult::Done;
  }

  std::string error;
  bool ok = false;
  for(int attempt = 0; attempt <= options_.upload_retries; ++attempt) {
    if(attempt > 0) {
      auto delay = options_.retry_base_delay * (1 << (attempt - 1));
      logger_->warn("Sync job {}: retrying {} in {} ms ({})", id, rel, delay.count(), error);
      if(token && token->wait_for(delay)) break;
    }
    error.clear();
    ok = client_->upload(target, file, rel, error, token);
    if(ok || (token && token->cancelled())) break;
  }
  if(!ok && token && token->cancelled()) {
    std::lock_guard<std::mutex> lock(mutex_);
    if(auto* rt = find(id)) item_for(rt->job, rel).status = SyncFileStatus::Pending;
    return BatchResult::Cancelled;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(auto* rt = find(id)) {
      auto& job = rt->job;
      auto& item = item_for(job, rel);
      if(ok) {
        item.status = SyncFileStatus::Completed;
        item.completed_at = WallClock::now();
        job.synced_count++;
        job.transferred_bytes += size;
      } else {
        item.status = SyncFileStatus::Failed;
        item.error = error;
        job.failed_count++;
        job.failed_files.push_back(SyncError{rel, error, WallClock::now()});
      }
      update_speed(job);
    }
  }
  if(ok) {
    logger_->info("Sync job {}: synced {}", id, rel);
  } else {
    logger_->error("Sync job {}: failed to sync {}: {}", id, rel, error);
  }
  publish(id);
  return BatchResult::Done;
}

void SyncEngine::on_watch_event(const std::string& id, const WatchEvent& event) {
  if(event.type == WatchEventType::Removed) {
    Device target;
    std::string rel;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto* rt = find(id);
      if(!rt || rt->stopping || !running_phase(rt->job.phase)) return;
      rel = relative_of(rt->job.source_directory, event.path);
      target = rt->target;
      rt->pending.erase(event.path);
      auto prefix = rel + "/";
      auto& items = rt->job.file_items;
      items.erase(std::remove_if(items.begin(), items.end(), [&](const SyncFileItem& item){
        return item.relative_path == rel || item.relative_path.rfind(prefix, 0) == 0;
      }), items.end());
    }
    std::string error;
    if(!client_->remove(target, rel, error)) {
      logger_->warn("Sync job {}: remote delete of {} failed: {}", id, rel, error);
    }
    publish(id);
    return;
  }
  if(event.is_directory) return;

  std::lock_guard<std::mutex> lock(mutex_);
  auto* rt = find(id);
  if(!rt || rt->stopping || !running_phase(rt->job.phase)) return;
  rt->pending.insert(event.path);
  rt->flush_at = std::chrono::steady_clock::now() + options_.change_debounce;
  rt->cv.notify_all();
}

bool SyncEngine::load() {
  if(options_.jobs_file.empty()) return false;
  std::ifstream in(options_.jobs_file);
  if(!in) return false;
  auto doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.contains("jobs") || !doc["jobs"].is_array()) {
    logger_->warn("Ignoring unreadable sync job file {}", options_.jobs_file.string());
    return false;
  }

  std::vector<SyncJob> loaded;
  for(const auto& item : doc["jobs"]) {
    auto job = SyncJob::from_json(item);
    if(!job) {
      logger_->warn("Skipping malformed sync job entry");
      continue;
    }
    job->phase = SyncPhase::Idle;
    job->status = "Ready";
    loaded.push_back(std::move(*job));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& job : loaded) {
      if(jobs_.count(job.id)) continue;
      auto rt = std::make_unique<Runtime>();
      rt->job = job;
      rt->target.id = job.target_device_id;
      rt->target.name = job.target_device_name;
      rt->target.ip = job.target_device_ip;
      rt->target.port = kDefaultTransferPort;
      jobs_.emplace(job.id, std::move(rt));
    }
  }
  for(const auto& job : loaded) {
    if(job.schedule && job.schedule->enabled) scheduler_.arm(job.id, *job.schedule);
  }
  logger_->info("Loaded {} sync jobs", loaded.size());
  return true;
}

bool SyncEngine::save() const {
  if(options_.jobs_file.empty()) return false;
  nlohmann::json doc;
  doc["jobs"] = nlohmann::json::array();
  for(const auto& job : jobs()) doc["jobs"].push_back(job.to_json());

  std::error_code ec;
  std::filesystem::create_directories(options_.jobs_file.parent_path(), ec);
  std::ofstream out(options_.jobs_file);
  if(!out) {
    logger_->warn("Cannot write sync jobs to {}", options_.jobs_file.string());
    return false;
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}

SubscriptionHandle SyncEngine::subscribe(EventChannel<SyncJob>::Callback callback) {
  return events_.subscribe(std::move(callback));
}

void SyncEngine::unsubscribe(SubscriptionHandle handle) {
  events_.unsubscribe(handle);
}
