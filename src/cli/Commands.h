#pragma once

#include <QStringList>

class Settings;

// Exit statuses shared by every command
enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

// Each command parses its own options from `args`, where args[0] is the
// program name followed by the command word.
namespace Commands {

int scan(const QStringList& args, Settings& settings);
int catalog(const QStringList& args, Settings& settings);
int idmap(const QStringList& args, Settings& settings);
int profile(const QStringList& args, Settings& settings);
int recommend(const QStringList& args, Settings& settings);

} // namespace Commands
