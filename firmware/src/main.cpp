#include <Arduino.h>
#include "application.h"

Application gApp;

void setup() {
    gApp.init();
}

void loop() {
    gApp.loop();
}
