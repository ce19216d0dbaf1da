#pragma once

#ifndef PROCVISOR_VERSION
#define PROCVISOR_VERSION "0.3.0"
#endif

int cli_dispatch(int argc, char** argv);
int cli_forward(int argc, char** argv, int first, bool raw_json);
int cli_daemon();
