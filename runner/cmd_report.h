#pragma once

int cmd_report(int argc, char** argv);
int cmd_verify_log(int argc, char** argv);
