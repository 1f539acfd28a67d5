#pragma once

int cmd_music(int argc, char** argv);
