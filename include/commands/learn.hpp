#pragma once

int cmd_learn(int argc, char** argv);
