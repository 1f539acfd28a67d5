#pragma once

int cmd_movie(int argc, char** argv);
