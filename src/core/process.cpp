#include "core/process.hpp"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QProcess>
#include <QStringList>

namespace core {

namespace {
std::string trimmed(const QByteArray& bytes) {
    return QString::fromUtf8(bytes).trimmed().toStdString();
}

// Emit complete lines from `pending`, keeping any partial tail.
void flush_lines(QByteArray& pending, const LineCallback& on_line, bool final_flush) {
    int nl = -1;
    while ((nl = pending.indexOf('\n')) >= 0) {
        QByteArray line = pending.left(nl);
        pending.remove(0, nl + 1);
        if (line.endsWith('\r')) line.chop(1);
        if (on_line && !line.isEmpty()) on_line(QString::fromUtf8(line).toStdString());
    }
    if (final_flush && !pending.isEmpty()) {
        if (on_line) on_line(QString::fromUtf8(pending).trimmed().toStdString());
        pending.clear();
    }
}
} // namespace

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
    std::string out = program;
    for (const auto& a : args) {
        out += ' ';
        out += a;
    }
    return out;
}

CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          const LogFn& log,
                          const LineCallback& on_line,
                          bool check,
                          const CancelCheck& cancelled) {
    if (log) log("Running: " + format_command(program, args));
    log_debug("exec: " + format_command(program, args));

    QStringList qargs;
    for (const auto& a : args) qargs << QString::fromStdString(a);

    QProcess proc;
    proc.setProgram(QString::fromStdString(program));
    proc.setArguments(qargs);
    proc.start();
    if (!proc.waitForStarted(-1)) {
        throw ProcessError("Failed to start " + program + ": " + proc.errorString().toStdString(), -1);
    }

    QByteArray out_all;
    QByteArray err_all;
    QByteArray pending;
    while (proc.state() != QProcess::NotRunning) {
        if (cancelled && cancelled()) {
            proc.kill();
            proc.waitForFinished(-1);
            log_debug("killed: " + program);
            throw ProcessCancelled(program);
        }
        proc.waitForReadyRead(200);
        // drain stderr too so a chatty child never blocks on a full pipe
        err_all += proc.readAllStandardError();
        QByteArray chunk = proc.readAllStandardOutput();
        if (!chunk.isEmpty()) {
            out_all += chunk;
            pending += chunk;
            flush_lines(pending, on_line, false);
        }
    }
    proc.waitForFinished(-1);
    QByteArray tail = proc.readAllStandardOutput();
    out_all += tail;
    pending += tail;
    flush_lines(pending, on_line, true);

    CommandResult result;
    result.stdout_text = out_all.toStdString();
    err_all += proc.readAllStandardError();
    result.stderr_text = err_all.toStdString();
    result.exit_code = (proc.exitStatus() == QProcess::CrashExit) ? -1 : proc.exitCode();

    if (proc.exitStatus() == QProcess::CrashExit) {
        throw ProcessError(program + " crashed", -1);
    }
    if (check && result.exit_code != 0) {
        std::string message = trimmed(err_all);
        if (message.empty()) message = trimmed(out_all);
        if (message.empty()) message = "Command failed";
        throw ProcessError(message, result.exit_code);
    }
    return result;
}

QJsonObject run_json(const std::string& program,
                     const std::vector<std::string>& args,
                     const LogFn& log,
                     const CancelCheck& cancelled) {
    CommandResult result = run_command(program, args, log, {}, true, cancelled);
    QJsonParseError err{};
    QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(result.stdout_text), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        throw ProcessError("Invalid JSON from " + program + ": " + err.errorString().toStdString(), 0);
    }
    return doc.object();
}

}
