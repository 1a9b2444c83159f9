#pragma once

#include <string>

namespace trisolar::gameplay
{
/// Rejection reasons sent back to clients in ActionRejected packets.
namespace reason
{
constexpr const char* kNotFound = "not_found";
constexpr const char* kTooFar = "too_far";
constexpr const char* kWrongState = "wrong_state";
constexpr const char* kNotAssigned = "not_assigned";
constexpr const char* kAlreadyCompleted = "already_completed";
constexpr const char* kInUse = "in_use";
constexpr const char* kBusy = "busy";
constexpr const char* kCooldown = "cooldown";
constexpr const char* kNoCharges = "no_charges";
constexpr const char* kNoTarget = "no_target";
constexpr const char* kNotAllowed = "not_allowed";
constexpr const char* kLocked = "locked";
constexpr const char* kNoUses = "no_uses";
} // namespace reason

struct ActionResult
{
    bool ok = true;
    std::string reason;

    [[nodiscard]] static ActionResult Ok() { return ActionResult{}; }
    [[nodiscard]] static ActionResult Fail(const char* why) { return ActionResult{false, why}; }

    explicit operator bool() const { return ok; }
};
} // namespace trisolar::gameplay
