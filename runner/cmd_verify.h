#pragma once

int cmd_verify(int argc, char** argv);
int cmd_ask(int argc, char** argv);
