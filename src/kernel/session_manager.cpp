/*
 * execd C++ - Kernel Session Manager Implementation
 */
#include <execd/kernel/session_manager.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/subprocess.hpp>
#include <execd/core/utils.hpp>

#include <sys/stat.h>

namespace execd {

namespace {

ExecutionError context_dead_error(const std::string& context_id) {
    return ExecutionError(ErrorCode::KernelCrashed, "KernelCrashed",
                          "context " + context_id + " is dead; create a new context");
}

ExecutionError cancelled_error() {
    return ExecutionError(ErrorCode::Cancelled, "Cancelled", "execution cancelled");
}

} // anonymous namespace

const char* context_state_name(ContextState state) {
    switch (state) {
        case ContextState::Initializing: return "Initializing";
        case ContextState::Ready: return "Ready";
        case ContextState::Busy: return "Busy";
        case ContextState::Dead: return "Dead";
    }
    return "Dead";
}

Json ContextInfo::to_json() const {
    Json j;
    j["id"] = id;
    j["language"] = language;
    j["session_id"] = session_id.empty() ? Json() : Json(session_id);
    j["state"] = context_state_name(state);
    j["execution_count"] = execution_count;
    j["queue_depth"] = queue_depth;
    j["current_execution"] = current_execution.empty() ? Json() : Json(current_execution);
    j["created_at"] = created_at;
    j["last_activity"] = last_activity;
    return j;
}

// ============================================================================
// SessionManager
// ============================================================================

SessionManager::SessionManager(ExecutionRegistry& registry, const Workspace& workspace,
                               const SessionOptions& options, const KernelFactory& factory)
    : registry_(registry)
    , workspace_(workspace)
    , options_(options)
    , factory_(factory)
    , shutting_down_(false)
{
}

SessionManager::~SessionManager() {
    shutdown();
}

SessionManager::ContextPtr SessionManager::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ContextPtr>::const_iterator it = contexts_.find(id);
    if (it == contexts_.end()) return ContextPtr();
    return it->second;
}

std::vector<SessionManager::ContextPtr> SessionManager::snapshot_contexts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ContextPtr> out;
    out.reserve(contexts_.size());
    for (std::map<std::string, ContextPtr>::const_iterator it = contexts_.begin();
         it != contexts_.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

ContextInfo SessionManager::describe(const Context& ctx) {
    std::lock_guard<std::mutex> lock(ctx.mutex);
    ContextInfo info;
    info.id = ctx.id;
    info.language = ctx.language;
    info.session_id = ctx.session_id;
    info.sandbox_id = ctx.sandbox_id;
    info.state = ctx.state;
    info.execution_count = ctx.execution_count;
    info.queue_depth = ctx.queue.size();
    if (ctx.current) {
        info.current_execution = ctx.current->execution_id;
    }
    info.created_at = ctx.created_at;
    info.last_activity = ctx.last_activity;
    return info;
}

OpResult<ContextInfo> SessionManager::create_context(const ContextOptions& options) {
    std::string language;
    if (!normalize_language(options.language, language)) {
        return OpResult<ContextInfo>::fail(ErrorCode::ValidationError,
                                           "unsupported language: " + options.language);
    }
    for (std::map<std::string, std::string>::const_iterator it = options.envs.begin();
         it != options.envs.end(); ++it) {
        if (!valid_env_name(it->first)) {
            return OpResult<ContextInfo>::fail(ErrorCode::ValidationError,
                                               "invalid environment variable name: " + it->first);
        }
        if (it->second.find('\0') != std::string::npos) {
            return OpResult<ContextInfo>::fail(ErrorCode::ValidationError,
                                               "environment value contains a NUL byte: " + it->first);
        }
    }

    std::string cwd = workspace_.root();
    if (!options.cwd.empty()) {
        OpResult<std::string> resolved = workspace_.resolve(options.cwd);
        if (!resolved.success) {
            return OpResult<ContextInfo>::fail(resolved.code, resolved.error);
        }
        struct stat st;
        if (stat(resolved.value.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            return OpResult<ContextInfo>::fail(ErrorCode::NotFound,
                                               "working directory not found: " + options.cwd);
        }
        cwd = resolved.value;
    }

    // Session reuse
    if (!options.session_id.empty()) {
        std::vector<ContextPtr> all = snapshot_contexts();
        for (size_t i = 0; i < all.size(); ++i) {
            const ContextPtr& c = all[i];
            if (c->language != language || c->session_id != options.session_id) continue;
            ContextInfo info = describe(*c);
            if (info.state != ContextState::Dead) {
                LOG_DEBUG("[Sessions] Reusing context %s for session %s",
                          c->id.c_str(), options.session_id.c_str());
                return OpResult<ContextInfo>::ok(info);
            }
        }
    }

    std::unique_ptr<Kernel> kernel = factory_(language);
    if (!kernel) {
        return OpResult<ContextInfo>::fail(ErrorCode::ValidationError,
                                           "no kernel available for language: " + language);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return OpResult<ContextInfo>::fail(ErrorCode::InternalError, "session manager is shutting down");
        }
    }

    ContextPtr ctx = std::make_shared<Context>();
    ctx->id = generate_uuid();
    ctx->language = language;
    ctx->session_id = options.session_id;
    ctx->sandbox_id = options.sandbox_id;
    ctx->created_at = current_timestamp_ms();
    ctx->last_activity = ctx->created_at;
    ctx->kernel = std::move(kernel);

    KernelStartOptions start;
    start.cwd = cwd;
    start.envs = options.envs;
    start.start_timeout_ms = options_.start_timeout_ms;
    start.interrupt_grace_ms = options_.interrupt_grace_ms;

    LOG_DEBUG("[Sessions] Starting %s kernel for context %s (cwd=%s)",
              language.c_str(), ctx->id.c_str(), cwd.c_str());

    OpStatus started = ctx->kernel->start(start);
    if (!started.success) {
        // Kept as Dead so the failure stays visible until purged
        ctx->state = ContextState::Dead;
        ctx->dead_since = current_timestamp_ms();
        ctx->stopping = true;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            contexts_[ctx->id] = ctx;
        }
        LOG_ERROR("[Sessions] %s kernel for context %s failed to start: %s",
                  language.c_str(), ctx->id.c_str(), started.error.c_str());
        return OpResult<ContextInfo>::fail(started.code, started.error);
    }

    ctx->state = ContextState::Ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            ctx->kernel->shutdown();
            return OpResult<ContextInfo>::fail(ErrorCode::InternalError, "session manager is shutting down");
        }
        contexts_[ctx->id] = ctx;
        ctx->worker = std::thread(&SessionManager::worker_loop, this, ctx);
    }

    LOG_INFO("[Sessions] Context %s ready (%s)", ctx->id.c_str(), language.c_str());
    return OpResult<ContextInfo>::ok(describe(*ctx));
}

OpResult<std::string> SessionManager::submit_code(const std::string& context_id, const std::string& code,
                                                  double timeout_seconds) {
    if (trim(code).empty()) {
        return OpResult<std::string>::fail(ErrorCode::ValidationError, "code is required");
    }
    if (!is_valid_timeout(timeout_seconds)) {
        return OpResult<std::string>::fail(ErrorCode::ValidationError, "timeout out of range");
    }

    ContextPtr ctx = find(context_id);
    if (!ctx) {
        return OpResult<std::string>::fail(ErrorCode::NotFound, "context not found: " + context_id);
    }

    std::string execution_id;
    bool dead = false;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        if (ctx->closed) {
            return OpResult<std::string>::fail(ErrorCode::NotFound, "context not found: " + context_id);
        }
        execution_id = registry_.create(ExecutionKind::Code, ctx->sandbox_id, code, ctx->id);
        ctx->last_activity = current_timestamp_ms();

        if (ctx->state == ContextState::Dead) {
            dead = true;
        } else {
            CellPtr cell = std::make_shared<Cell>();
            cell->execution_id = execution_id;
            cell->code = code;
            if (timeout_seconds > 0) {
                cell->timeout_ms = static_cast<int64_t>(timeout_seconds * 1000.0);
            }
            ctx->queue.push_back(cell);
            ctx->cv.notify_all();
        }
    }

    if (dead) {
        registry_.set_status(execution_id, ExecutionStatus::KernelCrashed,
                             ExecutionOutcome::failed(context_dead_error(context_id)));
        LOG_DEBUG("[Sessions] %s submitted to dead context %s", execution_id.c_str(), context_id.c_str());
    } else {
        LOG_DEBUG("[Sessions] %s queued on context %s", execution_id.c_str(), context_id.c_str());
    }
    return OpResult<std::string>::ok(execution_id);
}

OpResult<CodeSubmission> SessionManager::submit_default(const std::string& sandbox_id,
                                                        const std::string& language,
                                                        const std::string& code,
                                                        double timeout_seconds) {
    std::string canonical;
    if (!normalize_language(language, canonical)) {
        return OpResult<CodeSubmission>::fail(ErrorCode::ValidationError, "unsupported language: " + language);
    }
    if (trim(code).empty()) {
        return OpResult<CodeSubmission>::fail(ErrorCode::ValidationError, "code is required");
    }
    if (!is_valid_timeout(timeout_seconds)) {
        return OpResult<CodeSubmission>::fail(ErrorCode::ValidationError, "timeout out of range");
    }

    std::string context_id;
    {
        std::lock_guard<std::mutex> lock(default_mutex_);
        std::map<std::string, std::string>::const_iterator it = default_contexts_.find(canonical);
        if (it != default_contexts_.end()) {
            ContextPtr existing = find(it->second);
            if (existing && describe(*existing).state != ContextState::Dead) {
                context_id = existing->id;
            }
        }
        if (context_id.empty()) {
            ContextOptions options;
            options.language = canonical;
            options.sandbox_id = sandbox_id;
            OpResult<ContextInfo> created = create_context(options);
            if (!created.success) {
                return OpResult<CodeSubmission>::fail(created.code, created.error);
            }
            context_id = created.value.id;
            default_contexts_[canonical] = context_id;
        }
    }

    OpResult<std::string> submitted = submit_code(context_id, code, timeout_seconds);
    if (!submitted.success) {
        return OpResult<CodeSubmission>::fail(submitted.code, submitted.error);
    }
    CodeSubmission submission;
    submission.execution_id = submitted.value;
    submission.context_id = context_id;
    return OpResult<CodeSubmission>::ok(submission);
}

// ============================================================================
// Worker
// ============================================================================

void SessionManager::worker_loop(ContextPtr ctx) {
    for (;;) {
        CellPtr cell;
        int64_t count = 0;
        {
            std::unique_lock<std::mutex> lock(ctx->mutex);
            while (!ctx->stopping && ctx->queue.empty()) {
                ctx->cv.wait(lock);
            }
            if (ctx->stopping) break;

            cell = ctx->queue.front();
            ctx->queue.pop_front();
            ctx->current = cell;
            ctx->state = ContextState::Busy;
            count = ++ctx->execution_count;
            ctx->last_activity = current_timestamp_ms();
        }

        const std::string& id = cell->execution_id;
        registry_.set_execution_count(id, count);
        registry_.set_status(id, ExecutionStatus::Running);

        KernelRequest request;
        request.code = cell->code;
        request.timeout_ms = cell->timeout_ms;
        request.cancel = &cell->cancel;

        ExecutionRegistry& registry = registry_;
        KernelReply reply = ctx->kernel->submit(request,
            [&registry, &id](StreamKind stream, const std::string& text) {
                registry.append_log(id, stream, text);
            });

        std::vector<CellPtr> orphans;
        bool closing = false;
        {
            std::lock_guard<std::mutex> lock(ctx->mutex);
            ctx->current.reset();
            ctx->last_activity = current_timestamp_ms();
            closing = ctx->closed;
            if (!reply.alive) {
                mark_dead(*ctx, orphans);
            } else if (ctx->state == ContextState::Busy) {
                ctx->state = ContextState::Ready;
            }
        }

        ExecutionStatus status = ExecutionStatus::Completed;
        ExecutionOutcome outcome;
        switch (reply.outcome) {
            case KernelOutcome::Ok:
                outcome = ExecutionOutcome::with_result(reply.result);
                break;
            case KernelOutcome::Error:
                status = ExecutionStatus::Failed;
                outcome = ExecutionOutcome::failed(reply.error);
                break;
            case KernelOutcome::Cancelled:
                status = ExecutionStatus::Cancelled;
                outcome = ExecutionOutcome::failed(cancelled_error());
                break;
            case KernelOutcome::TimedOut:
                status = ExecutionStatus::TimedOut;
                outcome = ExecutionOutcome::failed(
                    ExecutionError(ErrorCode::Timeout, "Timeout", "execution timed out"));
                break;
            case KernelOutcome::Crashed:
                if (closing || cell->cancel.load()) {
                    status = ExecutionStatus::Cancelled;
                    outcome = ExecutionOutcome::failed(cancelled_error());
                } else {
                    status = ExecutionStatus::KernelCrashed;
                    ExecutionError error = reply.error;
                    if (error.empty()) {
                        error = ExecutionError(ErrorCode::KernelCrashed, "KernelCrashed",
                                               ctx->language + " kernel exited unexpectedly");
                    }
                    error.code = ErrorCode::KernelCrashed;
                    outcome = ExecutionOutcome::failed(error);
                }
                break;
        }
        registry_.set_status(id, status, outcome);

        LOG_DEBUG("[Sessions] %s on context %s finished: %s",
                  id.c_str(), ctx->id.c_str(), execution_status_name(status));

        if (!reply.alive) {
            if (closing) {
                fail_cells(orphans, ExecutionStatus::Cancelled, cancelled_error());
            } else {
                LOG_WARN("[Sessions] Context %s is dead: %s kernel exited", ctx->id.c_str(), ctx->language.c_str());
                fail_cells(orphans, ExecutionStatus::KernelCrashed, context_dead_error(ctx->id));
            }
            break;
        }
    }
}

void SessionManager::mark_dead(Context& ctx, std::vector<CellPtr>& orphans) {
    if (ctx.state != ContextState::Dead) {
        ctx.state = ContextState::Dead;
        ctx.dead_since = current_timestamp_ms();
    }
    ctx.stopping = true;
    orphans.insert(orphans.end(), ctx.queue.begin(), ctx.queue.end());
    ctx.queue.clear();
    ctx.cv.notify_all();
}

void SessionManager::fail_cells(const std::vector<CellPtr>& cells, ExecutionStatus status,
                                const ExecutionError& error) {
    for (size_t i = 0; i < cells.size(); ++i) {
        registry_.set_status(cells[i]->execution_id, status, ExecutionOutcome::failed(error));
    }
}

void SessionManager::stop_context(const ContextPtr& ctx, ExecutionStatus orphan_status) {
    std::vector<CellPtr> orphans;
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        ctx->closed = true;
        ctx->stopping = true;
        orphans.assign(ctx->queue.begin(), ctx->queue.end());
        ctx->queue.clear();
        if (ctx->current) {
            ctx->current->cancel = true;
            running = true;
        }
        ctx->cv.notify_all();
    }

    if (running) {
        ctx->kernel->kill();
    }
    if (orphan_status == ExecutionStatus::Cancelled) {
        fail_cells(orphans, orphan_status, cancelled_error());
    } else {
        fail_cells(orphans, orphan_status, context_dead_error(ctx->id));
    }

    if (ctx->worker.joinable()) {
        ctx->worker.join();
    }
    ctx->kernel->shutdown();

    std::lock_guard<std::mutex> lock(ctx->mutex);
    if (ctx->state != ContextState::Dead) {
        ctx->state = ContextState::Dead;
        ctx->dead_since = current_timestamp_ms();
    }
}

// ============================================================================
// Control
// ============================================================================

void SessionManager::forget_default(const std::string& context_id) {
    std::lock_guard<std::mutex> lock(default_mutex_);
    for (std::map<std::string, std::string>::iterator it = default_contexts_.begin();
         it != default_contexts_.end(); ) {
        if (it->second == context_id) {
            default_contexts_.erase(it++);
        } else {
            ++it;
        }
    }
}

OpStatus SessionManager::close_context(const std::string& context_id) {
    ContextPtr ctx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, ContextPtr>::iterator it = contexts_.find(context_id);
        if (it == contexts_.end()) {
            return OpStatus::fail(ErrorCode::NotFound, "context not found: " + context_id);
        }
        ctx = it->second;
        contexts_.erase(it);
    }
    forget_default(context_id);

    stop_context(ctx, ExecutionStatus::Cancelled);
    LOG_INFO("[Sessions] Context %s closed", context_id.c_str());
    return OpStatus::ok();
}

OpStatus SessionManager::cancel(const std::string& execution_id) {
    std::vector<ContextPtr> all = snapshot_contexts();
    for (size_t i = 0; i < all.size(); ++i) {
        Context& ctx = *all[i];
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(ctx.mutex);
            if (ctx.current && ctx.current->execution_id == execution_id) {
                ctx.current->cancel = true;
                LOG_DEBUG("[Sessions] Interrupting %s on context %s", execution_id.c_str(), ctx.id.c_str());
                return OpStatus::ok();
            }
            for (std::deque<CellPtr>::iterator it = ctx.queue.begin(); it != ctx.queue.end(); ++it) {
                if ((*it)->execution_id == execution_id) {
                    ctx.queue.erase(it);
                    removed = true;
                    break;
                }
            }
        }
        if (removed) {
            registry_.set_status(execution_id, ExecutionStatus::Cancelled,
                                 ExecutionOutcome::failed(cancelled_error()));
            LOG_DEBUG("[Sessions] Removed queued %s from context %s", execution_id.c_str(), ctx.id.c_str());
            return OpStatus::ok();
        }
    }
    return OpStatus::ok();
}

OpResult<ContextInfo> SessionManager::get_context(const std::string& context_id) const {
    ContextPtr ctx = find(context_id);
    if (!ctx) {
        return OpResult<ContextInfo>::fail(ErrorCode::NotFound, "context not found: " + context_id);
    }
    return OpResult<ContextInfo>::ok(describe(*ctx));
}

std::vector<ContextInfo> SessionManager::list_contexts() const {
    std::vector<ContextPtr> all = snapshot_contexts();
    std::vector<ContextInfo> out;
    out.reserve(all.size());
    for (size_t i = 0; i < all.size(); ++i) {
        out.push_back(describe(*all[i]));
    }
    return out;
}

// ============================================================================
// Maintenance
// ============================================================================

bool SessionManager::idle_expired(const Context& ctx, int64_t now_ms) const {
    return ctx.state == ContextState::Ready && ctx.queue.empty() && !ctx.current &&
           options_.idle_timeout_seconds > 0 &&
           ctx.last_activity + options_.idle_timeout_seconds * 1000 < now_ms;
}

size_t SessionManager::reap_idle(int64_t now_ms) {
    std::vector<ContextPtr> all = snapshot_contexts();
    std::vector<ContextPtr> idle;

    for (size_t i = 0; i < all.size(); ++i) {
        Context& ctx = *all[i];
        bool candidate = false;
        bool expired = false;
        {
            std::lock_guard<std::mutex> lock(ctx.mutex);
            candidate = ctx.state == ContextState::Ready && ctx.queue.empty() && !ctx.current;
            expired = idle_expired(ctx, now_ms);
        }
        if (!candidate) continue;

        if (expired) {
            idle.push_back(all[i]);
            continue;
        }
        // A kernel that died between cells makes the context Dead
        if (!ctx.kernel->is_healthy()) {
            std::vector<CellPtr> orphans;
            {
                std::lock_guard<std::mutex> lock(ctx.mutex);
                mark_dead(ctx, orphans);
            }
            fail_cells(orphans, ExecutionStatus::KernelCrashed, context_dead_error(ctx.id));
            LOG_WARN("[Sessions] Context %s is dead: %s kernel exited while idle",
                     ctx.id.c_str(), ctx.language.c_str());
        }
    }

    size_t reclaimed = 0;
    for (size_t i = 0; i < idle.size(); ++i) {
        const ContextPtr& ctx = idle[i];
        {
            // A submission may have landed since the scan; only a context
            // that is still idle is taken out, and submit_code sees `closed`
            std::lock_guard<std::mutex> lock(mutex_);
            std::lock_guard<std::mutex> ctx_lock(ctx->mutex);
            if (ctx->closed || !idle_expired(*ctx, now_ms)) continue;
            ctx->closed = true;
            contexts_.erase(ctx->id);
        }
        forget_default(ctx->id);
        stop_context(ctx, ExecutionStatus::Cancelled);
        LOG_INFO("[Sessions] Reclaimed idle context %s", ctx->id.c_str());
        reclaimed++;
    }
    return reclaimed;
}

size_t SessionManager::purge_dead(int64_t now_ms) {
    std::vector<ContextPtr> dead;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::map<std::string, ContextPtr>::iterator it = contexts_.begin(); it != contexts_.end(); ) {
            bool expired = false;
            {
                std::lock_guard<std::mutex> ctx_lock(it->second->mutex);
                expired = it->second->state == ContextState::Dead &&
                          it->second->dead_since + options_.dead_retention_seconds * 1000 <= now_ms;
            }
            if (expired) {
                dead.push_back(it->second);
                contexts_.erase(it++);
            } else {
                ++it;
            }
        }
    }

    for (size_t i = 0; i < dead.size(); ++i) {
        stop_context(dead[i], ExecutionStatus::KernelCrashed);
        LOG_DEBUG("[Sessions] Purged dead context %s", dead[i]->id.c_str());
    }
    return dead.size();
}

void SessionManager::shutdown() {
    std::vector<ContextPtr> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        for (std::map<std::string, ContextPtr>::iterator it = contexts_.begin(); it != contexts_.end(); ++it) {
            all.push_back(it->second);
        }
        contexts_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(default_mutex_);
        default_contexts_.clear();
    }

    if (all.empty()) return;
    LOG_INFO("[Sessions] Stopping %zu context(s)", all.size());
    for (size_t i = 0; i < all.size(); ++i) {
        stop_context(all[i], ExecutionStatus::Cancelled);
    }
}

} // namespace execd
