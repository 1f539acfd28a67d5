#pragma once

int cmd_stats(int argc, char** argv);
