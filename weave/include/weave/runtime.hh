// weave

#pragma once

#include "weave/export.hh"
#include "weave/types.hh"

#include <cstdint>

namespace weave {
    class wvAllocator;
    class wvProgramState;
    struct wvProgram;

    enum class wvRuntimeErrorCode : uint8_t
    {
        None,
        NoProgram,
        NonMonotonicTime,
        StaleProgram,
        MigrationAmbiguity,
        InvalidProgram,
        PhaseViolation,
    };

    struct wvExternalValue
    {
        uint64_t nameHash = 0;
        float values[4] = {};
    };

    // sampled once, before the first step of a frame
    struct wvFrameInputs
    {
        wvExternalValue const* values = nullptr;
        uint32_t count = 0;
    };

    struct wvRuntimeOptions
    {
        float maxFrameDeltaMs = 250.f;
        float decayMs = 250.f;
    };

    struct wvRenderPassView
    {
        uint32_t count = 0;
        float const* positions = nullptr; // 2 floats per element
        float const* colors = nullptr;    // 4 floats per element
        float const* sizes = nullptr;     // 1 float per element
    };

    struct wvOutputView
    {
        uint64_t nameHash = 0;
        uint32_t stride = 0;
        uint32_t count = 0;
        float const* values = nullptr;
    };

    struct wvMigrationReport
    {
        wvRuntimeErrorCode code = wvRuntimeErrorCode::None;
        uint32_t migrated = 0;
        uint32_t initialized = 0;
        uint32_t discarded = 0;
        wvStableId ambiguousId = wvInvalidStableId;
    };

    /// Per-frame results; every buffer is a copy owned by the output object
    /// and stays valid until the output is passed to the next frame.
    ///
    /// Hosts cannot implement this interface; frames are only written into
    /// objects from wvCreateFrameOutput.
    class wvFrameOutput
    {
    public:
        [[nodiscard]] virtual double timeMs() const noexcept = 0;
        [[nodiscard]] virtual uint64_t frameIndex() const noexcept = 0;

        [[nodiscard]] virtual uint32_t renderPassCount() const noexcept = 0;
        [[nodiscard]] virtual wvRenderPassView renderPass(uint32_t index) const noexcept = 0;

        [[nodiscard]] virtual uint32_t outputCount() const noexcept = 0;
        [[nodiscard]] virtual wvOutputView output(uint32_t index) const noexcept = 0;
        [[nodiscard]] virtual bool findOutput(char const* name, wvOutputView& out_view) const noexcept = 0;

    protected:
        ~wvFrameOutput() = default;

    private:
        // only wvCreateFrameOutput makes these
        wvFrameOutput() = default;
        friend class wvFrameOutputBuffer;
    };

    WV_API [[nodiscard]] wvFrameOutput* wvCreateFrameOutput(wvAllocator& alloc);
    WV_API void wvDestroyFrameOutput(wvFrameOutput* output);

    WV_API [[nodiscard]] wvProgramState* wvCreateProgramState(wvAllocator& alloc, wvProgram* program, wvRuntimeOptions const& options = {});
    WV_API void wvDestroyProgramState(wvProgramState* state);

    WV_API [[nodiscard]] wvProgram* wvStateProgram(wvProgramState const* state) noexcept;

    // reads one lane of a state; returns the stride, or 0 if the id or lane is unknown
    WV_API uint32_t wvReadState(wvProgramState const* state, wvStableId stableId, uint32_t lane, float* out_values,
        uint32_t capacity) noexcept;
    WV_API bool wvWriteState(wvProgramState* state, wvStableId stableId, uint32_t lane, float const* values, uint32_t count) noexcept;
    WV_API [[nodiscard]] uint32_t wvStateLaneCount(wvProgramState const* state, wvStableId stableId) noexcept;

    // the whole persistent state block
    WV_API [[nodiscard]] float const* wvStateFloats(wvProgramState const* state, uint32_t& out_count) noexcept;

    /// Runs one frame: samples inputs, then Phase 1, then Phase 2.
    ///
    /// Rejects negative or decreasing timestamps without touching the state.
    WV_API bool wvAdvanceFrame(wvProgram const* program, wvProgramState& state, wvFrameInputs const& inputs, double timeMs,
        wvFrameOutput& out_frame, wvRuntimeErrorCode* out_error = nullptr);

    /// Carries persistent state across programs by stable identity.
    ///
    /// On MigrationAmbiguity nothing in newState is changed.
    WV_API bool wvMigrateState(wvProgramState const& oldState, wvProgramState& newState, wvMigrationReport& out_report);

    /// Owns the running program and its state and applies hot swaps between frames.
    class wvRuntime
    {
    public:
        // records the newest graph edit; programs compiled from older edits are stale
        virtual void noteGraphVersion(uint64_t version) = 0;

        virtual bool installProgram(wvProgram* program, uint64_t version) = 0;
        virtual bool advanceFrame(wvFrameInputs const& inputs, double timeMs, wvFrameOutput& out_frame) = 0;

        [[nodiscard]] virtual wvRuntimeErrorCode lastError() const noexcept = 0;
        [[nodiscard]] virtual wvMigrationReport const& lastMigration() const noexcept = 0;
        [[nodiscard]] virtual uint64_t installedVersion() const noexcept = 0;
        [[nodiscard]] virtual wvProgram* program() const noexcept = 0;
        [[nodiscard]] virtual wvProgramState* state() const noexcept = 0;

    protected:
        ~wvRuntime() = default;
    };

    WV_API [[nodiscard]] wvRuntime* wvCreateRuntime(wvAllocator& alloc, wvRuntimeOptions const& options = {});
    WV_API void wvDestroyRuntime(wvRuntime* runtime);
} // namespace weave
