#pragma once

int cmd_graph(int argc, char** argv);
