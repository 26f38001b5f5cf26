#pragma once

int cmd_student_add(int argc, char** argv);
int cmd_students(int argc, char** argv);
