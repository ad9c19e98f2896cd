#pragma once

int cmd_interview(int argc, char** argv);
