#pragma once

int cmd_explore(int argc, char** argv);
