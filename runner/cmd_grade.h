#pragma once

int cmd_graders(int argc, char** argv);
int cmd_validate(int argc, char** argv);
int cmd_grade(int argc, char** argv);
