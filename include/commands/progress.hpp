#pragma once

int cmd_progress(int argc, char** argv);
