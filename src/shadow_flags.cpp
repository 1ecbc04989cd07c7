#include "shadow_flags.hpp"
#include "status_snapshot.hpp"

namespace robot
{

    uint32_t flag_bit(ShadowFlag flag)
    {
        switch (flag)
        {
        case ShadowFlag::MoveActive:
            return flags::kMoveActive;
        case ShadowFlag::TurnActive:
            return flags::kTurnActive;
        case ShadowFlag::Moving:
            return flags::kMoving;
        case ShadowFlag::ImuCalibrating:
            return flags::kImuCalibrating;
        case ShadowFlag::SoundPlaying:
            return flags::kSoundPlaying;
        case ShadowFlag::SoundDownloading:
            return flags::kSoundDownloading;
        case ShadowFlag::Count:
            break;
        }
        return 0;
    }

    const char *flag_name(ShadowFlag flag)
    {
        switch (flag)
        {
        case ShadowFlag::MoveActive:
            return "move_active";
        case ShadowFlag::TurnActive:
            return "turn_active";
        case ShadowFlag::Moving:
            return "moving";
        case ShadowFlag::ImuCalibrating:
            return "imu_calibrating";
        case ShadowFlag::SoundPlaying:
            return "sound_playing";
        case ShadowFlag::SoundDownloading:
            return "sound_downloading";
        case ShadowFlag::Count:
            break;
        }
        return "unknown";
    }

    ShadowFlags::ShadowFlags(int hold_limit) : hold_limit_(hold_limit < 1 ? 1 : hold_limit)
    {
        for (auto &s : slots_)
            s.store(pack(ShadowState::Unset, 0));
    }

    void ShadowFlags::request_set(ShadowFlag flag) { slot(flag).store(pack(ShadowState::PendingSet, 0)); }

    void ShadowFlags::request_clear(ShadowFlag flag) { slot(flag).store(pack(ShadowState::PendingClear, 0)); }

    void ShadowFlags::cancel(ShadowFlag flag) { slot(flag).store(pack(ShadowState::Unset, 0)); }

    void ShadowFlags::cancel_all()
    {
        for (auto &s : slots_)
            s.store(pack(ShadowState::Unset, 0));
    }

    ShadowState ShadowFlags::state(ShadowFlag flag) const { return state_of(slot(flag).load()); }

    uint32_t ShadowFlags::apply(uint32_t raw_flags)
    {
        uint32_t result = raw_flags;
        for (size_t i = 0; i < kFlagCount; ++i)
        {
            const ShadowFlag flag = static_cast<ShadowFlag>(i);
            const uint32_t bit = flag_bit(flag);
            const bool raw_set = (raw_flags & bit) != 0;
            std::atomic<uint32_t> &word = slots_[i];

            uint32_t current = word.load();
            uint32_t next;
            ShadowState seen;
            do
            {
                seen = state_of(current);
                uint32_t held = held_of(current) + 1;
                switch (seen)
                {
                case ShadowState::PendingSet:
                    if (raw_set)
                        next = pack(ShadowState::Confirmed, 0);
                    else if (static_cast<int>(held) >= hold_limit_)
                        next = pack(ShadowState::Unset, 0);
                    else
                        next = pack(ShadowState::PendingSet, held);
                    break;
                case ShadowState::PendingClear:
                    if (!raw_set)
                        next = pack(ShadowState::Confirmed, 0);
                    else if (static_cast<int>(held) >= hold_limit_)
                        next = pack(ShadowState::Unset, 0);
                    else
                        next = pack(ShadowState::PendingClear, held);
                    break;
                default:
                    next = current;
                    break;
                }
                // A writer that raced us wins; recompute from its value.
            } while (next != current && !word.compare_exchange_weak(current, next));

            // The override is visible on the snapshot that confirms or expires it too.
            if (seen == ShadowState::PendingSet)
                result |= bit;
            else if (seen == ShadowState::PendingClear)
                result &= ~bit;
        }
        return result;
    }

} // namespace robot
