#pragma once

/*
TickScheduler: paces generations against wall-clock time.

Each frame, update() first checks whether progress has reached the
threshold. If so it resets progress to zero and reports a due step; the
frame's time is dropped. Otherwise, unless paused, progress grows by
speed * deltaTime. A step already due therefore still fires while paused,
and at most one step fires per frame.
*/
class TickScheduler {
    public:
        TickScheduler(float threshold, int minSpeed, int maxSpeed);

        // Returns true when a generation step should run this frame.
        bool update(float deltaTime);

        void togglePause() { isPaused = !isPaused; }
        void increaseSpeed();
        void decreaseSpeed();

        bool paused() const { return isPaused; }
        int speed() const { return tickSpeed; }
        float progress() const { return tickProgress; }
        float threshold() const { return maxTickProgress; }

    private:
        float maxTickProgress;
        int minSpeed;
        int maxSpeed;

        float tickProgress = 0.0f;
        int tickSpeed;
        bool isPaused = false;
};
