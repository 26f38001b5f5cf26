#pragma once

int cmd_groups(int argc, char** argv);
