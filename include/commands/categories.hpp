#pragma once

int cmd_categories(int argc, char** argv);
