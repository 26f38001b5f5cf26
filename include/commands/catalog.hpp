#pragma once

int cmd_init(int argc, char** argv);
int cmd_courses(int argc, char** argv);
int cmd_timeslots(int argc, char** argv);
