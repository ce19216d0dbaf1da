#pragma once

// Runs the supervisor in the foreground until shutdown or a signal.
// Returns the process exit code.
int daemon_start();
