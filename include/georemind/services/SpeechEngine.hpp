#pragma once

#include <QString>

namespace georemind {
namespace services {

enum class SpeechMode
{
    Location, // arrival at a geofence
    Snooze,   // task went to the pending queue
};

// speak() returns once playback started. Failures throw and are never fatal to callers.
class SpeechEngine
{
public:
    virtual ~SpeechEngine() = default;

    virtual bool isAvailable() = 0;
    virtual void speak(const QString &text, SpeechMode mode) = 0;
    virtual bool isSpeaking() = 0;
};

} // namespace services
} // namespace georemind
