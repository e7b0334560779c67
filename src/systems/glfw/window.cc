#include "window.hh"
#include "engine.hh"
#include "error.hh"
#include "log.hh"

#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>

namespace rune {

    namespace {
        void resize_callback(GLFWwindow* window, int, int) {
            static_cast<Window*>(glfwGetWindowUserPointer(window))->resized = true;
        }

        void key_callback(GLFWwindow* window, int key, int, int action, int) {
            if( key == GLFW_KEY_ESCAPE && action == GLFW_PRESS ) {
                glfwSetWindowShouldClose(window, GLFW_TRUE);
            }
        }
    }

    //_________________________________________
    void Window::init() {
        if( glfwInit() != GLFW_TRUE ) {
            throw Error(ErrorKind::eApiFailure, "glfw initialization failed");
        }
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

        handle = glfwCreateWindow((int)width, (int)height, title.c_str(), nullptr, nullptr);
        if( handle == nullptr ) {
            glfwTerminate();
            throw Error(ErrorKind::eApiFailure, fmt::format("window creation failed ({}x{})", width, height));
        }
        glfwSetWindowUserPointer(handle, this);
        glfwSetFramebufferSizeCallback(handle, resize_callback);
        glfwSetKeyCallback(handle, key_callback);
        log::info("window {}x{} \"{}\"", width, height, title);
    }

    //_________________________________________
    void Window::terminate() {
        glfwDestroyWindow(handle);
        handle = nullptr;
        glfwTerminate();
    }

    //_________________________________________
    void Window::tick() {
        glfwPollEvents();
        if( glfwWindowShouldClose(handle) ) {
            core->should_exit = true;
        }
    }

    f64 Window::time() const {
        return glfwGetTime();
    }
}
