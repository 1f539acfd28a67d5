#pragma once

int cmd_embed(int argc, char** argv);
