// weave

#include "weave/runtime.hh"
#include "weave/alloc.hh"
#include "weave/log.hh"
#include "weave/program.hh"

#include "state.hh"

#include <spdlog/spdlog.h>

#include <new>

namespace weave {
    namespace {
        class Runtime final : public wvRuntime
        {
        public:
            Runtime(wvAllocator& alloc, wvRuntimeOptions const& options) noexcept : allocator_(alloc), options_(options) {}
            ~Runtime();

            Runtime(Runtime const&) = delete;
            Runtime& operator=(Runtime const&) = delete;

            void noteGraphVersion(uint64_t version) override;

            bool installProgram(wvProgram* program, uint64_t version) override;
            bool advanceFrame(wvFrameInputs const& inputs, double timeMs, wvFrameOutput& out_frame) override;

            wvRuntimeErrorCode lastError() const noexcept override { return lastError_; }
            wvMigrationReport const& lastMigration() const noexcept override { return lastMigration_; }
            uint64_t installedVersion() const noexcept override { return installedVersion_; }
            wvProgram* program() const noexcept override { return state_ != nullptr ? state_->program : nullptr; }
            wvProgramState* state() const noexcept override { return state_; }

            wvAllocator& allocator() noexcept { return allocator_; }

        private:
            bool fail(wvRuntimeErrorCode code) noexcept
            {
                lastError_ = code;
                return false;
            }

            wvAllocator& allocator_;
            wvRuntimeOptions options_;
            wvProgramState* state_ = nullptr;
            uint64_t latestVersion_ = 0;
            uint64_t installedVersion_ = 0;
            wvRuntimeErrorCode lastError_ = wvRuntimeErrorCode::None;
            wvMigrationReport lastMigration_;
        };
    } // namespace

    wvRuntime* wvCreateRuntime(wvAllocator& alloc, wvRuntimeOptions const& options)
    {
        return new (alloc.allocate(sizeof(Runtime), alignof(Runtime))) Runtime(alloc, options);
    }

    void wvDestroyRuntime(wvRuntime* runtime)
    {
        if (runtime != nullptr)
        {
            Runtime* impl = static_cast<Runtime*>(runtime);
            wvAllocator& alloc = impl->allocator();
            impl->~Runtime();
            alloc.free(impl, sizeof(Runtime), alignof(Runtime));
        }
    }

    Runtime::~Runtime() { wvDestroyProgramState(state_); }

    void Runtime::noteGraphVersion(uint64_t version)
    {
        if (version > latestVersion_)
            latestVersion_ = version;
    }

    bool Runtime::installProgram(wvProgram* program, uint64_t version)
    {
        WV_GUARD_OR(program != nullptr, fail(wvRuntimeErrorCode::NoProgram));

        // a program built from an older edit than one already seen is never installed
        if (version < latestVersion_ || (state_ != nullptr && version < installedVersion_))
        {
            SPDLOG_LOGGER_WARN(wvLog(), "discarded stale program for graph version {}; newest is {}", version,
                latestVersion_ > installedVersion_ ? latestVersion_ : installedVersion_);
            return fail(wvRuntimeErrorCode::StaleProgram);
        }

        wvProgramState* const next = wvCreateProgramState(allocator_, program, options_);
        if (next == nullptr)
            return fail(wvRuntimeErrorCode::InvalidProgram);

        lastMigration_ = wvMigrationReport{};
        if (state_ != nullptr && !wvMigrateState(*state_, *next, lastMigration_))
        {
            // the running program keeps going untouched
            wvDestroyProgramState(next);
            return fail(lastMigration_.code);
        }

        if (state_ != nullptr)
        {
            SPDLOG_LOGGER_INFO(wvLog(), "hot swapped to graph version {}: {} states kept, {} initialized, {} discarded", version,
                lastMigration_.migrated, lastMigration_.initialized, lastMigration_.discarded);
        }
        else
        {
            SPDLOG_LOGGER_INFO(wvLog(), "installed program for graph version {}", version);
        }

        wvDestroyProgramState(state_);
        state_ = next;
        installedVersion_ = version;
        noteGraphVersion(version);
        lastError_ = wvRuntimeErrorCode::None;
        return true;
    }

    bool Runtime::advanceFrame(wvFrameInputs const& inputs, double timeMs, wvFrameOutput& out_frame)
    {
        if (state_ == nullptr)
            return fail(wvRuntimeErrorCode::NoProgram);
        return wvAdvanceFrame(state_->program, *state_, inputs, timeMs, out_frame, &lastError_);
    }
} // namespace weave
