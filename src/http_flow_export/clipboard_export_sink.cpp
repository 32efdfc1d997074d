#include "clipboard_export_sink.hpp"

#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include "logger.hpp"

namespace
{
// Blocks SIGPIPE on the calling thread only, so a dying clipboard command
// cannot kill us while we write. A SIGPIPE raised in the meantime is consumed
// before the previous mask is restored.
class ScopedBlockSigpipe
{
   public:
    ScopedBlockSigpipe()
    {
        sigemptyset(&m_sigpipe);
        sigaddset(&m_sigpipe, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        m_was_pending = sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
        m_blocked = pthread_sigmask(SIG_BLOCK, &m_sigpipe, &m_previous) == 0;
    }

    ~ScopedBlockSigpipe()
    {
        if (!m_blocked)
        {
            return;
        }
        sigset_t pending;
        sigemptyset(&pending);
        if (!m_was_pending && sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1)
        {
            const timespec no_wait{0, 0};
            while (sigtimedwait(&m_sigpipe, nullptr, &no_wait) == -1 && errno == EINTR)
            {
            }
        }
        pthread_sigmask(SIG_SETMASK, &m_previous, nullptr);
    }

    ScopedBlockSigpipe(const ScopedBlockSigpipe&) = delete;
    ScopedBlockSigpipe& operator=(const ScopedBlockSigpipe&) = delete;

   private:
    sigset_t m_sigpipe;
    sigset_t m_previous;
    bool m_was_pending{false};
    bool m_blocked{false};
};

// Owns a popen() stream; pclose() runs exactly once
class PipeWriter
{
   public:
    explicit PipeWriter(const std::string& command) : m_pipe(popen(command.c_str(), "w")) {}
    ~PipeWriter()
    {
        if (m_pipe != nullptr)
        {
            pclose(m_pipe);
        }
    }

    PipeWriter(const PipeWriter&) = delete;
    PipeWriter& operator=(const PipeWriter&) = delete;

    bool isOpen() const { return m_pipe != nullptr; }

    bool write(const std::string& data)
    {
        return std::fwrite(data.data(), 1, data.size(), m_pipe) == data.size() &&
               std::fflush(m_pipe) == 0;
    }

    // Wait status of the command, -1 if pclose itself failed
    int close()
    {
        int status = pclose(m_pipe);
        m_pipe = nullptr;
        return status;
    }

   private:
    FILE* m_pipe;
};

bool env_set(const char* name)
{
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0';
}
}  // namespace

bool ClipboardExportSink::hasTool(const std::string& tool)
{
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::optional<std::string> ClipboardExportSink::detectCommand()
{
    if (env_set("WAYLAND_DISPLAY") && hasTool("wl-copy"))
    {
        return std::string("wl-copy");
    }
    if (env_set("DISPLAY"))
    {
        if (hasTool("xclip"))
        {
            return std::string("xclip -selection clipboard");
        }
        if (hasTool("xsel"))
        {
            return std::string("xsel --clipboard --input");
        }
    }
    if (hasTool("pbcopy"))
    {
        return std::string("pbcopy");
    }
    return std::nullopt;
}

std::string ClipboardExportSink::describe() const
{
    return m_command.empty() ? "clipboard" : "clipboard (" + m_command + ")";
}

SinkResult ClipboardExportSink::deliver(const ExportArtifact& artifact)
{
    std::string command = m_command;
    if (command.empty())
    {
        auto detected = detectCommand();
        if (!detected)
        {
            return ExportError::sink(
                "No clipboard backend available (install wl-copy, xclip, xsel or pbcopy)");
        }
        command = *detected;
    }

    std::string text = artifact.toClipboardText();
    LOG_DEBUG("Copying " << text.size() << " bytes via '" << command << "'");

    errno = 0;
    PipeWriter pipe(command);
    if (!pipe.isOpen())
    {
        return ExportError::sink("Failed to start clipboard command '" + command +
                                 "': " + std::strerror(errno));
    }

    bool written = false;
    int status = -1;
    {
        // Taken after popen() so the child does not inherit the blocked mask
        ScopedBlockSigpipe block_sigpipe;
        written = pipe.write(text);
        status = pipe.close();
    }
    if (status == -1)
    {
        return ExportError::sink("Failed to wait for clipboard command '" + command + "'");
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return ExportError::sink("Clipboard command '" + command + "' failed with status " +
                                 std::to_string(code));
    }
    if (!written)
    {
        return ExportError::sink("Failed to write to clipboard command '" + command + "'");
    }
    return text.size();
}
