#include "mscan/app.hpp"

int main()
{
    app::Application app;
    return app.run();
}
