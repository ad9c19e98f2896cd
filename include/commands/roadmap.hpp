#pragma once

int cmd_roadmap(int argc, char** argv);
