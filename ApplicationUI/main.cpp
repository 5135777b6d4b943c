#include <QApplication>
#include <exception>
#include <iostream>

#include "CoreUtilities.hpp"
#include "PointerViewWidget.hpp"
#include "SceneObject.hpp"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);

    PointerViewWidget view;
    view.setWindowTitle(QStringLiteral("PointerViewer"));
    view.resize(960, 640);

    try
    {
        TICK(populate);

        SceneObject* cluster = view.addGroup(glm::vec3(-3.f, 0.f, 0.f));
        view.addSphere(glm::vec3(-4.f, 0.f, 0.f), 0.8f, cluster);
        view.addSphere(glm::vec3(-2.f, 1.f, -1.f), 0.6f, cluster);
        view.addSphere(glm::vec3(-3.f, -1.5f, 1.f), 0.5f, cluster);

        view.addSphere(glm::vec3(0.f, 0.f, 0.f), 1.2f);
        view.addBox(glm::vec3(3.5f, 0.f, 0.f), glm::vec3(1.f, 1.f, 1.f));
        view.addBox(glm::vec3(3.5f, 2.5f, -2.f), glm::vec3(0.5f, 0.5f, 2.f));

        TOCK(populate);
    }
    catch (const std::exception& e)
    {
        std::cerr << "PointerViewer: " << e.what() << "\n";
        return 1;
    }

    view.show();
    return app.exec();
}
