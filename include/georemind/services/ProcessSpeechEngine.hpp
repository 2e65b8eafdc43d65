#pragma once

#include <QProcess>
#include <QStringList>

#include "georemind/services/SpeechEngine.hpp"

namespace georemind {
namespace services {

// Speaks through an external synthesizer command such as espeak-ng, the text passed as last argument.
class ProcessSpeechEngine : public SpeechEngine
{
public:
    explicit ProcessSpeechEngine(const QString &command);
    ~ProcessSpeechEngine() override;

    bool isAvailable() override;
    void speak(const QString &text, SpeechMode mode) override;
    bool isSpeaking() override;

    void stop();

private:
    QString m_program;
    QStringList m_arguments;
    QProcess m_process;
};

} // namespace services
} // namespace georemind
