#pragma once

int cmd_suggest(int argc, char** argv);
