#include "georemind/services/ProcessSpeechEngine.hpp"

#include "georemind/core/Errors.hpp"
#include "georemind/core/Logging.hpp"

#include <QStandardPaths>

namespace georemind {
namespace services {

namespace {
constexpr int kStartTimeoutMs = 2000;

QString phrase(const QString &text, SpeechMode mode)
{
    switch (mode) {
    case SpeechMode::Location:
        return QStringLiteral("You have task: %1").arg(text.trimmed());
    case SpeechMode::Snooze:
        break;
    }
    return text.trimmed();
}
} // namespace

ProcessSpeechEngine::ProcessSpeechEngine(const QString &command)
{
    QStringList parts = command.split(QLatin1Char(' '), QString::SkipEmptyParts);
    if (!parts.isEmpty()) {
        m_program = parts.takeFirst();
        m_arguments = parts;
    }
}

ProcessSpeechEngine::~ProcessSpeechEngine()
{
    stop();
}

bool ProcessSpeechEngine::isAvailable()
{
    return !m_program.isEmpty() && !QStandardPaths::findExecutable(m_program).isEmpty();
}

void ProcessSpeechEngine::speak(const QString &text, SpeechMode mode)
{
    if (isSpeaking()) {
        stop();
    }
    const QString spoken = phrase(text, mode);
    m_process.start(m_program, m_arguments + QStringList{ spoken });
    if (!m_process.waitForStarted(kStartTimeoutMs)) {
        throw core::Error(QStringLiteral("Cannot start %1: %2").arg(m_program, m_process.errorString()));
    }
    qCDebug(lcApp) << "Speaking" << spoken;
}

bool ProcessSpeechEngine::isSpeaking()
{
    if (m_process.state() == QProcess::NotRunning) {
        return false;
    }
    // Lets QProcess notice an exit without an event loop.
    m_process.waitForFinished(0);
    return m_process.state() != QProcess::NotRunning;
}

void ProcessSpeechEngine::stop()
{
    if (m_process.state() != QProcess::NotRunning) {
        m_process.kill();
        m_process.waitForFinished(kStartTimeoutMs);
    }
}

} // namespace services
} // namespace georemind
