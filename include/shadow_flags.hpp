#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace robot
{

    // Robot flags the client predicts ahead of the robot's own report.
    enum class ShadowFlag : uint8_t
    {
        MoveActive,
        TurnActive,
        Moving,
        ImuCalibrating,
        SoundPlaying,
        SoundDownloading,
        Count
    };

    enum class ShadowState : uint8_t
    {
        Unset,        // snapshot bit is authoritative
        PendingSet,   // force the bit on until the robot reports it
        PendingClear, // force the bit off until the robot reports it
        Confirmed     // robot reported the requested value; snapshot bit is authoritative again
    };

    // Status flag bit for a shadow flag.
    uint32_t flag_bit(ShadowFlag flag);
    const char *flag_name(ShadowFlag flag);

    // Per-flag override state machine.
    //
    // Writers on the command side call request_set/request_clear/cancel; the
    // status worker calls apply() once per fresh snapshot. Each flag is one
    // atomic word (state + snapshots held) so the two sides never lock.
    //
    // A pending override is merged into every snapshot until the robot reports
    // the same value (Confirmed), it is cancelled, or hold_limit snapshots have
    // passed without confirmation (back to Unset).
    class ShadowFlags
    {
    public:
        explicit ShadowFlags(int hold_limit = 10);

        void request_set(ShadowFlag flag);
        void request_clear(ShadowFlag flag);
        void cancel(ShadowFlag flag);
        void cancel_all();

        ShadowState state(ShadowFlag flag) const;
        bool pending_set(ShadowFlag flag) const { return state(flag) == ShadowState::PendingSet; }
        bool pending_clear(ShadowFlag flag) const { return state(flag) == ShadowState::PendingClear; }

        // Merge pending overrides into raw robot flags and advance each flag's
        // state. Returns the flags to publish.
        uint32_t apply(uint32_t raw_flags);

        int hold_limit() const { return hold_limit_; }

    private:
        static constexpr std::size_t kFlagCount = static_cast<std::size_t>(ShadowFlag::Count);

        static uint32_t pack(ShadowState state, uint32_t held) { return (held << 8) | static_cast<uint32_t>(state); }
        static ShadowState state_of(uint32_t word) { return static_cast<ShadowState>(word & 0xFF); }
        static uint32_t held_of(uint32_t word) { return word >> 8; }

        std::atomic<uint32_t> &slot(ShadowFlag flag) { return slots_[static_cast<std::size_t>(flag)]; }
        const std::atomic<uint32_t> &slot(ShadowFlag flag) const { return slots_[static_cast<std::size_t>(flag)]; }

        std::array<std::atomic<uint32_t>, kFlagCount> slots_;
        int hold_limit_;
    };

} // namespace robot
