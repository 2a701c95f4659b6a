#pragma once

int cmd_scan(int argc, char** argv);
int cmd_normalize(int argc, char** argv);
int cmd_audit_verify(int argc, char** argv);
