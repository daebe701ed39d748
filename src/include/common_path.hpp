#pragma once

// Common path
#define CONFIG_DIR								"/etc/attendsync/"
#define DEFAULT_CONFIG_FILE						CONFIG_DIR "attendsync.json"
