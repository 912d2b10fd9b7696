// kvslog — headless capture of a key:value telemetry stream
//
// Reads records from a serial port (or stdin), logs them to CSV and reports
// newly seen signals and pump statistics. See kvs_shell.h for options.

#include <kvs_shell.h>

int main(int argc, char *argv[]) { return kvs::shell_main(argc, argv); }
